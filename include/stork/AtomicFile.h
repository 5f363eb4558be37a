/**
 * @file AtomicFile.h
 * @brief ".part" file handling for received files and small state files
 */

#pragma once

#include <filesystem>
#include <string>

namespace Stork {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute the "<final>.part" path used while a file is being written.
 *
 * Deterministic so callers (and a later run) can clean up partial files.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Publish a finished "<final>.part" under its final name
 *
 * Never replaces an existing finalPath, even one created concurrently by
 * another process: fails with "Final file already exists" instead.
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg);

/**
 * @brief Replace finalPath with @p contents via "<final>.part" and rename.
 *
 * Used for small state files (history, settings). An existing file is
 * replaced; readers see either the old or the new contents.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& contents,
                         std::string& errorMsg);

/**
 * @brief Best-effort removal of a partial file
 * @return true if the file is gone afterwards
 */
bool removePartialFile(const std::filesystem::path& tempPath);

}  // namespace Stork
