#pragma once
#include "ewkb/common.hpp"

namespace ewkb {

namespace core {

// Thrown when the shape code in an EWKB type word is outside 1..7, at any nesting depth.
// The whole decode (or encode) of the value is aborted.
class UnrecognizedShapeCodeException : public InvalidInputException {
private:
	uint32_t type_word;

public:
	explicit UnrecognizedShapeCodeException(uint32_t type_word);

	uint32_t GetTypeWord() const {
		return type_word;
	}
	uint32_t GetShapeCode() const;
};

// Thrown when the raw-bytes path of a handler is used but no BlobHandler was configured
class MisconfiguredFallbackException : public InternalException {
public:
	explicit MisconfiguredFallbackException(const string &handler_name);
};

} // namespace core

} // namespace ewkb
