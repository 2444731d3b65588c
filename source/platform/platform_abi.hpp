#ifndef INKWELL_PLATFORM_ABI_HPP
#define INKWELL_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>

namespace platform {

// Outcome of waiting for input on a file descriptor.
enum class InputStatus {
    Ready,    // at least one byte (or EOF) can be read without blocking
    Timeout,  // nothing arrived within the timeout
    Error,    // the descriptor is invalid or polling failed
};

// Read the entire contents of a file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Create the directory that will hold file_path, including missing parents.
// Returns true if it exists afterwards. Paths without a directory part succeed.
bool ensure_parent_directory(const std::string &file_path, std::string &error_message);

// Wait until descriptor has data, hit EOF, or timeout_milliseconds elapse.
InputStatus wait_for_input(int descriptor, int timeout_milliseconds);

// Read up to capacity bytes. Returns the byte count, 0 on EOF, -1 on error.
// Interrupted reads are retried.
long read_some(int descriptor, char *buffer, unsigned long capacity);

} // namespace platform

#endif // INKWELL_PLATFORM_ABI_HPP
