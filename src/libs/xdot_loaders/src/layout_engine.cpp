#include <xdot_loaders/layout_engine.hpp>
#include <xdot_parser/diagnostics.hpp>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace xdot_loaders {

namespace {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

// Removes the temporary input file when the run ends.
class TempFile {
public:
    TempFile() {
        std::error_code ec;
        const auto dir = std::filesystem::temp_directory_path(ec);
        std::string pattern = ((ec ? std::filesystem::path("/tmp") : dir) / "xdotview-XXXXXX").string();
        const int fd = ::mkstemp(pattern.data());
        if (fd >= 0) {
            ::close(fd);
            path_ = pattern;
        }
    }
    ~TempFile() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

DotProcessEngine::DotProcessEngine(std::string program, std::string format)
    : program_(std::move(program))
    , format_(std::move(format))
{
}

LayoutOutput DotProcessEngine::run(const std::string& dot_source) {
    auto logger = xdot_parser::diagnostics();

    TempFile input;
    if (!input.ok())
        return LoadError{LoadError::Kind::Io, "cannot create temporary file for layout input"};
    {
        std::ofstream out(input.path(), std::ios::binary);
        out << dot_source;
        if (!out)
            return LoadError{LoadError::Kind::Io, "cannot write layout input to " + input.path()};
    }

    std::ostringstream cmd;
    cmd << shell_quote(program_) << " -T" << shell_quote(format_) << " " << shell_quote(input.path());
    logger->debug("running layout: {}", cmd.str());

    const auto started = std::chrono::steady_clock::now();
    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe)
        return LoadError{LoadError::Kind::LayoutEngine, "cannot start '" + program_ + "'"};

    std::string output;
    std::array<char, 4096> buf;
    std::size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0)
        output.append(buf.data(), n);
    const int status = pclose(pipe);

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        logger->error("layout program '{}' failed (exit {})", program_, code);
        return LoadError{LoadError::Kind::LayoutEngine,
            "'" + program_ + "' exited with status " + std::to_string(code)};
    }
    if (output.empty())
        return LoadError{LoadError::Kind::LayoutEngine, "'" + program_ + "' produced no output"};

    logger->info("layout finished in {:.3f}s ({} bytes)", elapsed, output.size());
    return output;
}

LoadResult layout_graph(LayoutEngine& engine, const std::string& dot_source) {
    LayoutOutput out = engine.run(dot_source);
    if (auto* error = std::get_if<LoadError>(&out)) return *error;
    return load_graph_from_xdot(std::get<std::string>(out));
}

AsyncLayout::AsyncLayout(std::shared_ptr<LayoutEngine> engine)
    : engine_(std::move(engine))
{
    // Create the shared logger before any worker thread can.
    xdot_parser::diagnostics();
}

AsyncLayout::~AsyncLayout() {
    cancel();
    if (pending_.valid()) pending_.wait();
    for (auto& job : superseded_)
        job.wait();
}

std::uint64_t AsyncLayout::submit(std::string source, std::string source_name, bool already_laid_out) {
    const std::uint64_t ticket = ++next_ticket_;
    current_ticket_ = ticket;

    // Waiting here would block; the superseded job is reaped by poll() or the destructor.
    if (pending_.valid())
        superseded_.push_back(std::move(pending_));

    std::shared_ptr<LayoutEngine> engine = engine_;
    pending_ = std::async(std::launch::async,
        [engine, ticket, already_laid_out, source = std::move(source), name = std::move(source_name)]() {
            Completed done;
            done.ticket = ticket;
            done.source_name = name;
            if (already_laid_out)
                done.result = load_graph_from_xdot(source);
            else
                done.result = layout_graph(*engine, source);
            return done;
        });
    return ticket;
}

void AsyncLayout::cancel() {
    current_ticket_ = ++next_ticket_;
}

std::optional<AsyncLayout::Completed> AsyncLayout::poll() {
    std::erase_if(superseded_, [](const std::future<Completed>& job) {
        return job.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });

    if (!pending_.valid()) return std::nullopt;
    if (pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;
    Completed done = pending_.get();
    if (done.ticket != current_ticket_) return std::nullopt;
    return done;
}

} // namespace xdot_loaders
