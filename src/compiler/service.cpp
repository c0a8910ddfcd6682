#include "service.hpp"
#include <chrono>
#include <future>
#include <thread>

namespace nodebook::compiler {
#include "macros_open.hpp"

  auto GraphLocks::acquire(std::string const& graphId) -> std::unique_lock<std::mutex> {
    auto const lock = std::lock_guard(_mutex);
    return std::unique_lock(_locks[graphId]);
  }

  auto compileWithTimeout(
    std::string const& text,
    std::shared_ptr<schema::Schema const> schema,
    graph::Graph prior,
    graph::NodeRegistry registry,
    CompileOptions const& options
  ) -> CompileResult {
    if (options.timeoutMs == 0)
      return compile(text, *schema, prior, registry, options);

    auto promise = std::make_shared<std::promise<CompileResult>>();
    auto future = promise->get_future();
    // The thread owns everything it reads, so it may outlive this call.
    std::thread([=, prior = std::move(prior), registry = std::move(registry)] {
      try {
        promise->set_value(compile(text, *schema, prior, registry, options));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(options.timeoutMs)) == std::future_status::ready)
      return future.get();
    auto res = CompileResult();
    res.errors.push_back(
      {0, "compilation did not finish within " + std::to_string(options.timeoutMs) + " ms", cnl::ErrorKind::timeout}
    );
    return res;
  }

  auto CompileService::_run(std::string const& graphId, std::string const& text, CompileOptions const& options)
    -> CompileResult {
    auto const schema = _schemas.snapshot();
    auto prior = _store.loadGraphSnapshot(graphId);
    return compileWithTimeout(text, schema, std::move(prior), _store.registry(), options);
  }

  auto CompileService::submit(std::string const& graphId, std::string const& text, CompileOptions const& options)
    -> CompileResult {
    auto const lock = _locks.acquire(graphId);
    auto res = _run(graphId, text, options);
    if (res.ok) {
      _store.applyChangeList(graphId, res.changes);
      res.applied = true;
    }
    return res;
  }

  auto CompileService::check(std::string const& graphId, std::string const& text, CompileOptions const& options)
    -> CompileResult {
    auto const lock = _locks.acquire(graphId);
    return _run(graphId, text, options);
  }

#include "macros_close.hpp"
}
