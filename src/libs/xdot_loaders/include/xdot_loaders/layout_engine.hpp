#pragma once

#include <xdot_loaders/graph_loader.hpp>
#include <xdot_loaders/load_error.hpp>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xdot_loaders {

using LayoutOutput = std::variant<std::string, LoadError>;

// External program that turns a plain graph description into laid-out xdot text.
class LayoutEngine {
public:
    virtual ~LayoutEngine() = default;
    virtual LayoutOutput run(const std::string& dot_source) = 0;
};

// Runs a Graphviz program ("dot -Txdot" by default) as a child process.
class DotProcessEngine : public LayoutEngine {
public:
    explicit DotProcessEngine(std::string program = "dot", std::string format = "xdot");

    LayoutOutput run(const std::string& dot_source) override;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    std::string format_;
};

// Lays out and builds the graph in one blocking call.
LoadResult layout_graph(LayoutEngine& engine, const std::string& dot_source);

// Runs layout + graph building off the interactive thread. A newer submit()
// or cancel() supersedes the pending job; its result is dropped.
class AsyncLayout {
public:
    struct Completed {
        std::uint64_t ticket = 0;
        std::string source_name;
        LoadResult result;
    };

    explicit AsyncLayout(std::shared_ptr<LayoutEngine> engine);
    ~AsyncLayout();

    AsyncLayout(const AsyncLayout&) = delete;
    AsyncLayout& operator=(const AsyncLayout&) = delete;

    // Pass already_laid_out to skip the engine and only parse.
    std::uint64_t submit(std::string source, std::string source_name, bool already_laid_out = false);
    void cancel();

    bool busy() const { return pending_.valid(); }
    std::size_t superseded_jobs() const { return superseded_.size(); }

    // Non-blocking; yields each finished, non-superseded job once.
    std::optional<Completed> poll();

private:
    std::shared_ptr<LayoutEngine> engine_;
    std::future<Completed> pending_;
    std::vector<std::future<Completed>> superseded_;
    std::uint64_t current_ticket_ = 0;
    std::uint64_t next_ticket_ = 0;
};

} // namespace xdot_loaders
