/***
 * Name: pyp::support (fs)
 * Purpose: Minimal file IO helpers for templates, generated programs and reports.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream and POSIX calls to centralize
 *   error handling; every helper reports failure through err.
 */
#pragma once

#include <string>

namespace pyp {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** MakeTempFile: Create an empty, uniquely named file in the temp directory. */
bool MakeTempFile(const std::string& prefix, const std::string& suffix, std::string& out_path, std::string& err);

/*** RemoveFile: Remove path if it exists. Return true when it no longer exists. */
bool RemoveFile(const std::string& path, std::string& err);

}  // namespace support
}  // namespace pyp
