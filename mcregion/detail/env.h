#pragma once

#include <fmt/core.h>
#include <fmt/color.h>

#include <string>
#include <cstdint>

namespace mcregion {

	struct EnvOptions {
		bool readonly = false;
		// fsync() before the descriptor is released.
		bool syncOnClose = true;

		static EnvOptions getReadonly() {
			EnvOptions o;
			o.readonly = true;
			return o;
		}
	};

	//
	// Models one file opened with open(2).
	//
	// All I/O is positional (pread/pwrite), so the descriptor has no shared cursor.
	// Callers are responsible for serializing access; this class has no lock.
	//
	// Failures reported by the OS are thrown as BadFileError with the errno.
	//
	class FileEnvironment {
		public:

			FileEnvironment(const std::string& path, const EnvOptions& opts);
			~FileEnvironment();

			FileEnvironment(const FileEnvironment&) = delete;
			FileEnvironment& operator=(const FileEnvironment&) = delete;

			inline bool fileIsNew() const { return fileIsNew_; }
			inline bool isOpen() const { return fd_ >= 0; }
			inline bool readonly() const { return opts_.readonly; }
			inline int getFd() const { return fd_; }
			inline const std::string& path() const { return path_; }

			// Modification time when the file was opened, in ms since epoch. 0 if the file was created.
			inline int64_t mtimeMillis() const { return mtimeMillis_; }

			uint64_t length() const;

			// Reads up to @n bytes, stopping early only at end of file. Returns bytes read.
			size_t readAt(uint64_t offset, void* dst, size_t n) const;

			// Writes all @n bytes or throws.
			void writeAt(uint64_t offset, const void* src, size_t n);

			// Writes @n zero bytes starting at @offset.
			void writeZeros(uint64_t offset, size_t n);

			void sync();
			void close();

		private:
			std::string path_;
			EnvOptions opts_;
			bool fileIsNew_ = false;
			int64_t mtimeMillis_ = 0;
			int fd_ = -1;
	};

}
