#include "cbridge/process.hpp"

#include <fmt/format.h>

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <string>
#include <typeinfo>
#include <vector>

#include "logger.hpp"
#include "utils.hpp"

namespace cbridge {

namespace p2 = boost::process::v2;
namespace asio = boost::asio;

std::string describe(const command_spec& spec) {
  std::string res;
  for (const auto& a : spec.argv) {
    if (!res.empty()) res += " ";
    res += a;
  }
  return res;
}

fs::path find_executable(std::string_view name) {
  if (name.empty()) return {};
  if (name.find('/') != std::string_view::npos) {
    std::error_code ec;
    return fs::exists(name, ec) ? fs::path{name} : fs::path{};
  }
  return p2::environment::find_executable(std::string{name});
}

command_result run_command(const command_spec& spec) {
  command_result res{};
  if (spec.argv.empty()) {
    res.error = "empty command";
    return res;
  }

  auto exe = find_executable(spec.argv.front());
  if (exe.empty()) {
    res.error = fmt::format("executable not found: {}", spec.argv.front());
    LOG_DEBUG("{}", res.error);
    return res;
  }
  std::vector<std::string> args{spec.argv.begin() + 1, spec.argv.end()};
  fs::path workdir = spec.cwd.empty() ? fs::current_path() : spec.cwd;

  LOG_DEBUG("Running: {}", utils::tail(describe(spec), 400));
  LOG_TRACE("Workdir {}", workdir.string());

  asio::io_context ctx;
  asio::readable_pipe rp_out{ctx};
  asio::readable_pipe rp_err{ctx};
  asio::steady_timer timer{ctx};

  try {
    p2::process proc{
      ctx, exe, args,
      p2::process_stdio{.in = nullptr, .out = rp_out, .err = rp_err},
      p2::process_start_dir{workdir}};

    // Drain both pipes concurrently so a chatty stderr cannot stall the
    // child on a full stdout pipe.
    int open_pipes = 2;
    auto on_drained = [&](boost::system::error_code, std::size_t) {
      if (--open_pipes == 0) timer.cancel();
    };
    asio::async_read(rp_out, asio::dynamic_buffer(res.out), on_drained);
    asio::async_read(rp_err, asio::dynamic_buffer(res.err), on_drained);

    if (spec.timeout) {
      timer.expires_after(*spec.timeout);
      timer.async_wait([&](boost::system::error_code ec) {
        if (ec) return;
        res.timed_out = true;
        boost::system::error_code ignored;
        proc.terminate(ignored);
        // Grandchildren may still hold the write ends.
        rp_out.close(ignored);
        rp_err.close(ignored);
      });
    }

    ctx.run();

    boost::system::error_code ec;
    int code = proc.wait(ec);
    if (res.timed_out) {
      res.exit_code = -1;
      LOG_WARN(
          "Timed out after {}ms: {}", spec.timeout->count(),
          utils::tail(describe(spec), 200));
    } else if (ec) {
      res.exit_code = -1;
      res.error = fmt::format("wait failed: {}", ec.message());
    } else {
      res.exit_code = code;
    }
  } catch (const std::exception& e) {
    res.exit_code = -1;
    res.error = fmt::format(
        "{}: {}", utils::demangle_symbol(typeid(e).name()), e.what());
    LOG_WARN("Spawn of {} failed: {}", exe.string(), e.what());
  }

  LOG_DEBUG(
      "Exit {} ({} bytes out, {} bytes err)", res.exit_code, res.out.size(),
      res.err.size());
  return res;
}

}  // namespace cbridge
