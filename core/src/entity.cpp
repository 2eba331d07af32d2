#include "feedctl/entity.h"

#include <stdexcept>
#include <utility>

namespace feedctl {

Value Value::scalar(std::string text) {
  Value value;
  value.data_ = std::move(text);
  return value;
}

Value Value::repeated(std::vector<Value> items) {
  Value value;
  value.data_ = std::move(items);
  return value;
}

Value Value::entity(EntityPtr entity) {
  if (!entity) {
    throw std::invalid_argument("Value::entity requires a non-null entity");
  }
  Value value;
  value.data_ = std::move(entity);
  return value;
}

Value::Kind Value::kind() const {
  switch (data_.index()) {
    case 1:
      return Kind::Scalar;
    case 2:
      return Kind::Repeated;
    case 3:
      return Kind::Entity;
    default:
      return Kind::Null;
  }
}

const std::string& Value::as_scalar() const {
  return std::get<std::string>(data_);
}

const std::vector<Value>& Value::as_repeated() const {
  return std::get<std::vector<Value>>(data_);
}

const Entity& Value::as_entity() const {
  return *std::get<EntityPtr>(data_);
}

std::string Value::text_or_empty() const {
  if (const auto* text = std::get_if<std::string>(&data_)) {
    return *text;
  }
  return "";
}

void Entity::set(const std::string& name, Value value) {
  for (auto& field : fields_) {
    if (field.name == name) {
      field.value = std::move(value);
      return;
    }
  }
  fields_.push_back(Field{name, std::move(value)});
}

const Value* Entity::find(const std::string& name) const {
  for (const auto& field : fields_) {
    if (field.name == name) return &field.value;
  }
  return nullptr;
}

}  // namespace feedctl
