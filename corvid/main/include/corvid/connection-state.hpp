#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/connection.hpp"
#include "corvid/request-parser.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

enum class ConnectionPhase : uint8_t {
  AwaitingRequestLine,
  ParsingHeaders,
  AwaitingBody,
  ReadyToDispatch,
  Dispatched,
  Closing,
  Closed
};

std::string_view ConnectionPhaseToStr(ConnectionPhase phase);

// State of one accepted connection. Exclusively owned by the HttpServer of the process.
struct ConnectionState {
  enum class CloseMode : uint8_t { None, DrainThenClose, Immediate };

  ConnectionState(Connection connection, ParserLimits limits) : cnx(std::move(connection)), parser(limits) {}

  [[nodiscard]] int fd() const noexcept { return cnx.fd(); }

  [[nodiscard]] bool isImmediateCloseRequested() const noexcept { return closeMode == CloseMode::Immediate; }
  [[nodiscard]] bool isDrainCloseRequested() const noexcept { return closeMode == CloseMode::DrainThenClose; }
  [[nodiscard]] bool isAnyCloseRequested() const noexcept { return closeMode != CloseMode::None; }

  [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

  [[nodiscard]] std::string_view pendingOutput() const noexcept {
    return std::string_view(outBuffer).substr(outOffset);
  }

  [[nodiscard]] bool canCloseImmediately() const noexcept {
    return isImmediateCloseRequested() || (isDrainCloseRequested() && !hasPendingOutput());
  }

  // Close now, dropping any buffered output.
  void requestImmediateClose() {
    closeMode = CloseMode::Immediate;
    phase = ConnectionPhase::Closing;
  }

  // Close once buffered output is flushed.
  void requestDrainAndClose() {
    if (closeMode == CloseMode::None) {
      closeMode = CloseMode::DrainThenClose;
    }
    phase = ConnectionPhase::Closing;
  }

  // Nothing received of a next request and nothing left to send.
  [[nodiscard]] bool isIdle() const noexcept {
    return phase == ConnectionPhase::AwaitingRequestLine && inBuffer.empty() && !hasPendingOutput();
  }

  // Align phase and read timestamps with the parser progress after a parse() returning kStatusNeedMoreData.
  void updateReadProgress(SteadyTimePoint now);

  // Forget the served request, keeping the bytes of a pipelined one.
  void prepareNextRequest();

  void consumeOutput(std::size_t nbBytes);

  Connection cnx;
  RequestParser parser;
  ConnectionPhase phase{ConnectionPhase::AwaitingRequestLine};
  CloseMode closeMode{CloseMode::None};
  bool waitingWritable{false};
  // Reading and dispatching suspended until buffered output drops under the outbound limit.
  bool readPaused{false};
  uint32_t requestsServed{0};
  std::size_t outOffset{0};
  std::string inBuffer;
  std::string outBuffer;
  std::string peerAddress;
  SteadyTimePoint lastActivity;
  // Reception start of the current request head, and of its body. Zero when not started.
  SteadyTimePoint headerStartTp;
  SteadyTimePoint bodyStartTp;
};

}  // namespace corvid
