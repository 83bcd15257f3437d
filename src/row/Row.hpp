#pragma once

#include "type/WireTypes.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Pancake {

// One logical record of a segment: column name -> value. Iteration follows
// insertion order (the order columns were requested in); Get looks a column
// up by name.
class Row {
public:
  using Field = std::pair<std::string, FieldValue>;
  using const_iterator = std::vector<Field>::const_iterator;

  Row() = default;

  explicit Row(size_t capacity) {
    fields_.reserve(capacity);
    index_.reserve(capacity);
  }

  // Returns false and leaves the row unchanged when name is already present.
  bool Insert(std::string name, FieldValue value);

  // nullptr when the row has no such column
  const FieldValue *Get(const std::string &name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &fields_[it->second].second;
  }

  bool Contains(const std::string &name) const {
    return index_.contains(name);
  }

  size_t Size() const { return fields_.size(); }

  bool Empty() const { return fields_.empty(); }

  const Field &At(size_t idx) const { return fields_[idx]; }

  const_iterator begin() const { return fields_.begin(); }
  const_iterator end() const { return fields_.end(); }

  std::vector<std::string> Names() const;

  // Wire form, e.g. for writing the row back with WriteToPartition.
  idl::Row ToProto() const;

  // Same columns in the same order with equal values.
  bool operator==(const Row &other) const;

private:
  std::vector<Field> fields_;
  std::unordered_map<std::string, size_t> index_;
};
} // namespace Pancake
