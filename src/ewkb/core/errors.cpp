#include "ewkb/common.hpp"
#include "ewkb/core/errors.hpp"
#include "ewkb/core/geometry/geometry_type.hpp"

namespace ewkb {

namespace core {

UnrecognizedShapeCodeException::UnrecognizedShapeCodeException(uint32_t type_word_p)
    : InvalidInputException(StringUtil::Format("EWKB: Unrecognized shape code %d in type word %d",
                                               static_cast<int64_t>(type_word_p & EWKBFlags::SHAPE_MASK),
                                               static_cast<int64_t>(type_word_p))),
      type_word(type_word_p) {
}

uint32_t UnrecognizedShapeCodeException::GetShapeCode() const {
	return type_word & EWKBFlags::SHAPE_MASK;
}

MisconfiguredFallbackException::MisconfiguredFallbackException(const string &handler_name)
    : InternalException(StringUtil::Format(
          "%s: raw byte access was requested but the handler was created without a BlobHandler", handler_name)) {
}

} // namespace core

} // namespace ewkb
