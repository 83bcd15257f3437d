#include "row/Row.hpp"

#include <google/protobuf/util/message_differencer.h>

namespace Pancake {

bool Row::Insert(std::string name, FieldValue value) {
  if (index_.contains(name)) {
    return false;
  }
  index_.emplace(name, fields_.size());
  fields_.emplace_back(std::move(name), std::move(value));
  return true;
}

std::vector<std::string> Row::Names() const {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto &[name, value] : fields_) {
    names.push_back(name);
  }
  return names;
}

idl::Row Row::ToProto() const {
  idl::Row row;
  auto &fields = *row.mutable_fields();
  for (const auto &[name, value] : fields_) {
    fields[name] = value;
  }
  return row;
}

bool Row::operator==(const Row &other) const {
  if (fields_.size() != other.fields_.size()) {
    return false;
  }
  for (size_t i = 0; i < fields_.size(); i++) {
    if (fields_[i].first != other.fields_[i].first ||
        !google::protobuf::util::MessageDifferencer::Equals(
            fields_[i].second, other.fields_[i].second)) {
      return false;
    }
  }
  return true;
}
} // namespace Pancake
