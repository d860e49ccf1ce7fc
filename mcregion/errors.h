#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>

namespace mcregion {

	enum class ErrorKind {
		NotFound,
		ReadOnlyViolation,
		OutOfBounds,
		InvalidSector,
		InvalidLength,
		UnsupportedCodecVersion,
		ChunkTooLarge,
		CorruptPayload,
		BadRegionName,
		Closed,
	};

	inline const char* errorKindName(ErrorKind k) {
		switch (k) {
			case ErrorKind::NotFound:                return "NotFound";
			case ErrorKind::ReadOnlyViolation:       return "ReadOnlyViolation";
			case ErrorKind::OutOfBounds:             return "OutOfBounds";
			case ErrorKind::InvalidSector:           return "InvalidSector";
			case ErrorKind::InvalidLength:           return "InvalidLength";
			case ErrorKind::UnsupportedCodecVersion: return "UnsupportedCodecVersion";
			case ErrorKind::ChunkTooLarge:           return "ChunkTooLarge";
			case ErrorKind::CorruptPayload:          return "CorruptPayload";
			case ErrorKind::BadRegionName:           return "BadRegionName";
			case ErrorKind::Closed:                  return "Closed";
		}
		return "Unknown";
	}

	//
	// Every engine-level failure is a RegionError.
	// Match on kind() rather than on the type.
	//
	// InvalidSector, InvalidLength and CorruptPayload mean a single cell of the
	// container is damaged. The rest of the file is still usable.
	//
	struct RegionError : public std::runtime_error {
		ErrorKind kind_;

		inline RegionError(ErrorKind kind, const std::string& msg)
			: std::runtime_error(fmt::format("{}({})", errorKindName(kind), msg)), kind_(kind)
		{ }

		inline ErrorKind kind() const { return kind_; }

		inline bool isCorruption() const {
			return kind_ == ErrorKind::InvalidSector
				or kind_ == ErrorKind::InvalidLength
				or kind_ == ErrorKind::CorruptPayload;
		}
	};

	// Thrown when the OS reports a failure on the underlying file.
	// @code is the errno at the point of failure.
	struct BadFileError : public std::runtime_error {
		const std::string file;
		int code;

		inline BadFileError(const std::string& file, const std::string& op, int code=0)
			: std::runtime_error(fmt::format("BadFileError(f={}, op={}, c={})", file, op, code)), file(file), code(code)
		{}
	};

}
