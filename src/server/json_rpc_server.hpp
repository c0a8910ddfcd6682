#ifndef NODEBOOK_SERVER_JSON_RPC_SERVER_HPP
#define NODEBOOK_SERVER_JSON_RPC_SERVER_HPP

#include <functional>
#include <iosfwd>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <common.hpp>
#include <nlohmann/json.hpp>

namespace nodebook::server {
#include "macros_open.hpp"

  // JSON-RPC 2.0 error codes.
  // See: https://www.jsonrpc.org/specification#error_object
  enum ErrorCode : int32_t {
    parseError = -32700,
    invalidRequest = -32600,
    methodNotFound = -32601,
    invalidParams = -32602,
    internalError = -32603
  };

  // Thrown by a method handler to reply with a specific error code.
  struct JsonRpcException: std::runtime_error {
    ErrorCode code;
    JsonRpcException(ErrorCode code, std::string const& s):
        std::runtime_error(s),
        code(code) {}
  };

  // Serves JSON-RPC over a pair of streams with LSP base-protocol framing (`Content-Length` headers).
  class JsonRpcServer {
  public:
    using Method = std::function<nlohmann::json(JsonRpcServer*, nlohmann::json const&)>;
    using Notification = std::function<void(JsonRpcServer*, nlohmann::json const&)>;

    JsonRpcServer(std::istream& in, std::ostream& out):
        _in(in),
        _out(out) {}

    // Only before `startListen()`.
    auto addMethod(std::string const& name, Method f) -> void {
      assert(!_inThread.joinable());
      _methods.insert_or_assign(name, std::move(f));
    }
    auto addNotification(std::string const& name, Notification f) -> void {
      assert(!_inThread.joinable());
      _notifications.insert_or_assign(name, std::move(f));
    }

    // Safe to call from any thread.
    auto callNotification(std::string const& method, nlohmann::json const& params) -> void;

    // Handlers run one at a time on the listener thread.
    auto startListen() -> void;
    auto requestStop() -> void { _inThread.request_stop(); }
    auto waitForComplete() -> void { _inThread.join(); }

  private:
    std::istream& _in;
    std::ostream& _out;
    std::mutex _outMutex;
    std::jthread _inThread;

    std::unordered_map<std::string, Method> _methods;
    std::unordered_map<std::string, Notification> _notifications;

    auto _readNextPacket() -> std::optional<std::string>;
    auto _handleMessage(nlohmann::json const& j) -> void;

    auto _send(nlohmann::json const& j) -> void;
    auto _sendResult(int64_t id, nlohmann::json const& result) -> void;
    auto _sendError(ErrorCode code, std::string const& msg) -> void;
    auto _sendError(int64_t id, ErrorCode code, std::string const& msg) -> void;
    auto _logError(std::string const& msg) -> void;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_SERVER_JSON_RPC_SERVER_HPP
