#pragma once

#include "Result.h"
#include "UniqueFd.h"
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace BlockSync {

    /**
     * @brief Writes a file through a temporary sibling and an atomic rename
     *
     * The temporary file is created next to the target (same filesystem, so
     * rename(2) is atomic) as ".<name>.XXXXXX.tmp". Until commit() succeeds
     * the target is untouched; a writer destroyed without commit() removes
     * its temporary file.
     *
     * @code
     * AtomicFileWriter writer(target);
     * if (auto r = writer.open(); !r) return r;
     * if (auto r = writer.write(data, len); !r) return r;  // temp removed on scope exit
     * return writer.commit();
     * @endcode
     */
    class AtomicFileWriter {
    public:
        explicit AtomicFileWriter(std::filesystem::path targetPath);
        ~AtomicFileWriter();

        AtomicFileWriter(const AtomicFileWriter&) = delete;
        AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

        /// Create the temporary file. Permissions follow the target if it exists.
        bsync::Result<void> open();

        /// Append bytes to the temporary file.
        bsync::Result<void> write(const uint8_t* data, size_t len);

        /// fsync, rename over the target, then fsync the directory.
        bsync::Result<void> commit();

        /// Drop the temporary file; the target is left as it was.
        void discard();

        const std::filesystem::path& targetPath() const { return targetPath_; }
        const std::filesystem::path& tempPath() const { return tempPath_; }
        uint64_t bytesWritten() const { return bytesWritten_; }

    private:
        std::filesystem::path targetPath_;
        std::filesystem::path tempPath_;
        bsync::UniqueFd fd_;
        uint64_t bytesWritten_ = 0;
        bool committed_ = false;
    };

}
