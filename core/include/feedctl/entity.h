#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace feedctl {

class Entity;

using EntityPtr = std::shared_ptr<const Entity>;

/// Untyped field value of a feed entity: null, scalar text, a repeated group
/// or a nested entity.
/// MUST be handled exhaustively by consumers; Null renders like an empty scalar.
class Value {
 public:
  enum class Kind { Null, Scalar, Repeated, Entity };

  Value() = default;

  static Value null() { return Value(); }
  static Value scalar(std::string text);
  static Value repeated(std::vector<Value> items);
  static Value entity(EntityPtr entity);

  Kind kind() const;
  bool is_null() const { return kind() == Kind::Null; }

  /// Typed accessors. MUST only be called for the matching kind.
  const std::string& as_scalar() const;
  const std::vector<Value>& as_repeated() const;
  const Entity& as_entity() const;

  /// Returns the scalar text, or an empty string for Null.
  /// Inputs are scalar/null values; other kinds also yield an empty string.
  std::string text_or_empty() const;

 private:
  std::variant<std::monostate, std::string, std::vector<Value>, EntityPtr> data_;
};

/// Named field of an entity.
struct Field {
  std::string name;
  Value value;
};

/// Ordered mapping from field name to value, representing one feed record.
/// Field names are unique; insertion order is the output order.
/// Read-only once shared through an EntityPtr.
class Entity {
 public:
  /// Appends a field, or replaces the value of an existing one in place.
  /// MUST keep the field position on replacement (last write wins).
  void set(const std::string& name, Value value);
  /// Returns the value of a field or nullptr when absent.
  const Value* find(const std::string& name) const;

  const std::vector<Field>& fields() const { return fields_; }
  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

 private:
  std::vector<Field> fields_;
};

/// Ordered sequence of entities as returned by the server.
using Feed = std::vector<EntityPtr>;

}  // namespace feedctl
