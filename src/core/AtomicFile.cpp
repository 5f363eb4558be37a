/**
 * @file AtomicFile.cpp
 * @brief ".part" files: write aside, publish by rename
 */

#include "stork/AtomicFile.h"
#include "stork/Debug.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace Stork {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    // link(2) fails with EEXIST instead of replacing a file that appeared
    // after the destination was chosen
    if (::link(tempPath.c_str(), finalPath.c_str()) == 0) {
        if (!removePartialFile(tempPath)) {
            LOG_WARNING("[AtomicFile] Published " << finalPath.string() << " but could not remove "
                                                   << tempPath.string());
        }
        return true;
    }
    const int linkErrno = errno;
    if (linkErrno == EEXIST) {
        errorMsg = "Final file already exists";
        return false;
    }
    if (linkErrno != EPERM && linkErrno != ENOTSUP && linkErrno != EXDEV) {
        errorMsg = std::string("link failed: ") + std::strerror(linkErrno);
        return false;
    }

    // Filesystem without hard links: check, then rename
    if (std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists";
        return false;
    }
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }
    return true;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& contents,
                         std::string& errorMsg)
{
    errorMsg.clear();
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        std::filesystem::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Cannot create directory " + finalPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Cannot open " + paths.tempPath.string() + " for writing";
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            errorMsg = "Write failed: " + paths.tempPath.string();
            out.close();
            removePartialFile(paths.tempPath);
            return false;
        }
    }

    // rename(2) replaces the destination atomically
    std::filesystem::rename(paths.tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        removePartialFile(paths.tempPath);
        return false;
    }
    return true;
}

bool removePartialFile(const std::filesystem::path& tempPath)
{
    std::error_code ec;
    std::filesystem::remove(tempPath, ec);
    return !std::filesystem::exists(tempPath, ec);
}

}  // namespace Stork
