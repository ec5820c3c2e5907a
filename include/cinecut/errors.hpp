/**
 * @file errors.hpp
 * @brief Fatal pipeline errors
 *
 * @details Components below the export orchestrator never retry. They either
 *          report failure through a bool/nullptr return (logged at the call
 *          site) or raise ExportError for conditions that must end the
 *          export. The orchestrator turns the first error into the single
 *          terminal result.
 */

#ifndef CINECUT_ERRORS_HPP
#define CINECUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cinecut {

enum class ErrorKind {
  Configuration, //< Missing stream, decoder, encoder or codec parameters
  Decode,        //< Bitstream fed out of order or not starting at a key frame
  Io,            //< Pipe or external process failure
  Cancelled      //< User cancellation
};

/// Terminal message used for user cancellation.
inline const char *cancelled_message() { return "Export cancelled."; }

class ExportError : public std::runtime_error {
public:
  ExportError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace cinecut

#endif // CINECUT_ERRORS_HPP
