#include "store/records.h"

#include "common/errors.h"

namespace store {

const char* TagRoleToText(TagRole role) {
  return role == TagRole::REFERENCE ? "ref" : "tar";
}

TagRole TagRoleFromText(const std::string& s) {
  if (s == "ref" || s == "reference") return TagRole::REFERENCE;
  if (s == "tar" || s == "target")    return TagRole::TARGET;
  throw rfpos::DataError("Tag role must be 'ref' or 'tar', got '" + s + "'");
}

void ValidateTag(const Tag& tag) {
  if (tag.tag_id.empty()) {
    throw rfpos::DataError("Tag id must not be empty");
  }
  if (tag.true_x.has_value() != tag.true_y.has_value()) {
    throw rfpos::DataError("Tag '" + tag.tag_id + "' has only one true coordinate");
  }
  if (tag.pred_x.has_value() != tag.pred_y.has_value()) {
    throw rfpos::DataError("Tag '" + tag.tag_id + "' has only one predicted coordinate");
  }
  if (tag.role == TagRole::REFERENCE) {
    if (!tag.HasTruePosition()) {
      throw rfpos::DataError("Reference tag '" + tag.tag_id + "' requires true coordinates");
    }
    if (tag.HasPredictedPosition()) {
      throw rfpos::DataError("Reference tag '" + tag.tag_id + "' must not carry predicted coordinates");
    }
  }
}

} // namespace store
