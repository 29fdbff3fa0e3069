#include "kild/terminal/terminal.hpp"

namespace kild::terminal {

std::string_view TerminalError::code() const {
  switch (kind) {
  case TerminalErrorKind::NotAvailable:
    return "TERMINAL_NOT_AVAILABLE";
  case TerminalErrorKind::UnknownTerminal:
    return "UNKNOWN_TERMINAL";
  case TerminalErrorKind::SpawnFailed:
    return "TERMINAL_SPAWN_FAILED";
  case TerminalErrorKind::CloseFailed:
    return "TERMINAL_CLOSE_FAILED";
  case TerminalErrorKind::QueryFailed:
    return "TERMINAL_QUERY_FAILED";
  }
  return "TERMINAL_SPAWN_FAILED";
}

} // namespace kild::terminal
