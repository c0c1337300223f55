#include <process/exceptions.hpp>
#include <process/process_runner.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <chrono>
#include <future>
#include <system_error>

namespace bp  = boost::process;
namespace net = boost::asio;

namespace {

boost::filesystem::path resolve_executable(std::string const &command) {
    if(command.find('/') != std::string::npos)
        return boost::filesystem::path{ command };

    auto resolved = bp::search_path(command);
    if(resolved.empty())
        throw CommandLaunchException{ command, "not found on PATH" };
    return resolved;
}

} // namespace

std::string ProcessRunner::run(std::string const &command,
    std::vector<std::string> const &args,
    variables_t const &variables,
    std::chrono::seconds timeout) const {
    auto const executable = resolve_executable(command);

    bp::environment env = boost::this_process::environment();
    for(auto const &[key, value] : variables)
        env[key] = value;

    net::io_context ctx;
    std::future<std::string> out;
    std::future<std::string> err;

    auto const deadline = std::chrono::steady_clock::now() + timeout;

    bp::child child;
    try {
        child = bp::child{
            bp::exe = executable.string(),
            bp::args = args,
            env,
            bp::std_in.close(),
            bp::std_out > out,
            bp::std_err > err,
            ctx
        };
    } catch(bp::process_error const &e) {
        throw CommandLaunchException{ command, e.what() };
    }

    auto const timed_out = [&] {
        std::error_code ignored;
        child.terminate(ignored); // kills and reaps
        return CommandTimeoutException{ command, timeout };
    };

    // returns early once both pipes hit eof
    ctx.run_until(deadline);
    if(not ctx.stopped())
        throw timed_out();

    // the pipes may close long before the child exits
    std::error_code ec;
    auto const exited = child.wait_until(deadline, ec);
    if(ec)
        throw CommandLaunchException{ command, ec.message() };
    if(not exited)
        throw timed_out();

    auto const exit_code = child.exit_code();
    if(exit_code != 0)
        throw CommandFailedException{ command, exit_code, err.get() };

    return out.get();
}
