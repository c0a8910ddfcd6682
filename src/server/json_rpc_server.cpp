#include "json_rpc_server.hpp"
#include <charconv>
#include <istream>
#include <optional>
#include <ostream>

namespace nodebook::server {
#include "macros_open.hpp"

  using nlohmann::json;

  // LSP 3.16 accepts no other Content-Type.
  constexpr auto contentType = std::string_view("application/vscode-jsonrpc; charset=utf-8");

  auto message() -> json {
    return {
      {"jsonrpc", "2.0"}
    };
  }

  auto JsonRpcServer::callNotification(std::string const& method, json const& params) -> void {
    auto j = message();
    j["method"] = method;
    j["params"] = params;
    _send(j);
  }

  // One header line, without its "\r\n" terminator.
  auto readHeaderLine(std::istream& in) -> std::optional<std::string> {
    auto res = std::string();
    if (!std::getline(in, res))
      return std::nullopt;
    if (res.ends_with('\r'))
      res.pop_back();
    return res;
  }

  // Header fields, then exactly `Content-Length` bytes of content.
  // See: https://microsoft.github.io/language-server-protocol/specifications/specification-3-16/#headerPart
  auto JsonRpcServer::_readNextPacket() -> std::optional<std::string> {
    auto length = std::optional<size_t>();
    while (true) {
      auto const line = readHeaderLine(_in);
      if (!line)
        return std::nullopt;
      if (line->empty())
        break;
      auto const sep = line->find(": ");
      if (sep == std::string::npos)
        return std::nullopt;
      auto const key = std::string_view(*line).substr(0, sep);
      auto const value = std::string_view(*line).substr(sep + 2);
      if (key == "Content-Length") {
        auto n = 0uz;
        auto const [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || ptr != value.data() + value.size())
          return std::nullopt;
        length = n;
      } else if (key == "Content-Type" && value != contentType) {
        _logError("unsupported Content-Type \"" + std::string(value) + "\"");
      }
    }
    if (!length)
      return std::nullopt;

    auto res = std::string(*length, '\0');
    _in.read(res.data(), static_cast<std::streamsize>(*length));
    if (_in.gcount() != static_cast<std::streamsize>(*length))
      return std::nullopt;
    return res;
  }

  auto JsonRpcServer::startListen() -> void {
    _inThread = std::jthread([this](std::stop_token stopToken) {
      // Ends on `exit`, or when the client closes the input stream.
      while (!stopToken.stop_requested()) {
        auto const packet = _readNextPacket();
        if (!packet)
          break;
        auto const j = json::parse(*packet, nullptr, false);
        if (j.is_discarded())
          _sendError(ErrorCode::parseError, "content is not valid JSON");
        else if (j.is_array())
          for (auto const& e: j)
            _handleMessage(e);
        else
          _handleMessage(j);
      }
    });
  }

  auto JsonRpcServer::_handleMessage(json const& j) -> void {
    if (!j.is_object() || !j.contains("jsonrpc") || j["jsonrpc"] != "2.0") {
      _sendError(ErrorCode::invalidRequest, "expected a JSON-RPC 2.0 message");
      return;
    }
    // Without a method, this is a response. The server never sends requests, so it is dropped.
    if (!j.contains("method") || !j["method"].is_string())
      return;

    auto const method = j["method"].get<std::string>();
    auto const params = j.contains("params") && j["params"].is_object() ? j["params"] : json::object();

    if (!j.contains("id") || !j["id"].is_number_integer()) {
      if (auto const it = _notifications.find(method); it != _notifications.end()) {
        try {
          it->second(this, params);
        } catch (std::exception& e) {
          _logError("notification \"" + method + "\" failed: " + e.what());
        }
      }
      return;
    }

    auto const id = j["id"].get<int64_t>();
    auto const it = _methods.find(method);
    if (it == _methods.end()) {
      _sendError(id, ErrorCode::methodNotFound, "method \"" + method + "\" not found");
      return;
    }
    try {
      _sendResult(id, it->second(this, params));
    } catch (JsonRpcException& e) {
      _sendError(id, e.code, e.what());
    } catch (json::exception& e) {
      _sendError(id, ErrorCode::invalidParams, e.what());
    } catch (std::exception& e) {
      _logError("method \"" + method + "\" failed: " + e.what());
      _sendError(id, ErrorCode::internalError, e.what());
    }
  }

  auto JsonRpcServer::_send(json const& j) -> void {
    auto const content = j.dump();
    auto const lock = std::lock_guard(_outMutex);
    _out << "Content-Length: " << content.size() << "\r\n"
         << "Content-Type: " << contentType << "\r\n"
         << "\r\n"
         << content;
    _out.flush();
  }

  auto JsonRpcServer::_sendResult(int64_t id, json const& result) -> void {
    auto j = message();
    j["id"] = id;
    j["result"] = result;
    _send(j);
  }

  auto JsonRpcServer::_sendError(ErrorCode code, std::string const& msg) -> void {
    auto j = message();
    j["id"] = nullptr;
    j["error"] = {
      {   "code", code},
      {"message",  msg}
    };
    _send(j);
  }

  auto JsonRpcServer::_sendError(int64_t id, ErrorCode code, std::string const& msg) -> void {
    auto j = message();
    j["id"] = id;
    j["error"] = {
      {   "code", code},
      {"message",  msg}
    };
    _send(j);
  }

  // Reported to the client as `window/logMessage` with type Error.
  auto JsonRpcServer::_logError(std::string const& msg) -> void {
    callNotification(
      "window/logMessage",
      {
        {   "type",   1},
        {"message", msg}
    }
    );
  }

#include "macros_close.hpp"
}
