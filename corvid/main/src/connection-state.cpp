#include "corvid/connection-state.hpp"

#include <cstddef>
#include <string_view>

#include "corvid/request-parser.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

std::string_view ConnectionPhaseToStr(ConnectionPhase phase) {
  switch (phase) {
    case ConnectionPhase::AwaitingRequestLine:
      return "awaiting-request-line";
    case ConnectionPhase::ParsingHeaders:
      return "parsing-headers";
    case ConnectionPhase::AwaitingBody:
      return "awaiting-body";
    case ConnectionPhase::ReadyToDispatch:
      return "ready-to-dispatch";
    case ConnectionPhase::Dispatched:
      return "dispatched";
    case ConnectionPhase::Closing:
      return "closing";
    case ConnectionPhase::Closed:
      return "closed";
    default:
      return "unknown";
  }
}

void ConnectionState::updateReadProgress(SteadyTimePoint now) {
  switch (parser.state()) {
    case ParserState::AwaitingRequestLine:
      phase = ConnectionPhase::AwaitingRequestLine;
      // A partial request line is already part of the head.
      if (!inBuffer.empty() && headerStartTp == SteadyTimePoint{}) {
        headerStartTp = now;
      }
      break;
    case ParserState::ParsingHeaders:
      phase = ConnectionPhase::ParsingHeaders;
      if (headerStartTp == SteadyTimePoint{}) {
        headerStartTp = now;
      }
      break;
    case ParserState::AwaitingBody:
      phase = ConnectionPhase::AwaitingBody;
      headerStartTp = {};
      if (bodyStartTp == SteadyTimePoint{}) {
        bodyStartTp = now;
      }
      break;
    case ParserState::ReadyToDispatch:
      phase = ConnectionPhase::ReadyToDispatch;
      break;
    case ParserState::Failed:
      phase = ConnectionPhase::Closing;
      break;
  }
}

void ConnectionState::prepareNextRequest() {
  parser.reset();
  phase = ConnectionPhase::AwaitingRequestLine;
  headerStartTp = {};
  bodyStartTp = {};
}

void ConnectionState::consumeOutput(std::size_t nbBytes) {
  outOffset += nbBytes;
  if (outOffset >= outBuffer.size()) {
    outBuffer.clear();
    outOffset = 0;
  } else if (outOffset > outBuffer.size() / 2) {
    // Keep the sent prefix from accumulating while the peer reads slowly.
    outBuffer.erase(0, outOffset);
    outOffset = 0;
  }
}

}  // namespace corvid
