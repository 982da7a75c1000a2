#include "exec/suite.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>

namespace ordo::exec {

namespace {

auto next_instance() -> uint64_t {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

} // namespace

void TestContext::info(std::string message) {
    ++notes_;
    emit_(events::InfoProvided{std::move(message)});
}

void TestContext::markup(std::string text) {
    ++notes_;
    emit_(events::MarkupProvided{std::move(text)});
}

FunctionSuite::FunctionSuite(std::string name, std::string id)
    : name_(std::move(name)), id_(std::move(id)) {
    if (id_.empty()) {
        id_ = name_ + "#" + std::to_string(next_instance());
    }
}

auto FunctionSuite::test(std::string name, TestBody body) -> FunctionSuite& {
    plan_.add_test(name);
    bodies_[std::move(name)] = std::move(body);
    return *this;
}

auto FunctionSuite::ignore(std::string name) -> FunctionSuite& {
    plan_.add_test(std::move(name), true);
    return *this;
}

auto FunctionSuite::scope(const std::string& text,
                          const std::function<void(FunctionSuite&)>& body) -> FunctionSuite& {
    plan_.add_scope_opened(text);
    body(*this);
    plan_.add_scope_closed(text);
    return *this;
}

auto FunctionSuite::note(std::string text) -> FunctionSuite& {
    plan_.add_note(std::move(text));
    return *this;
}

auto FunctionSuite::nest(Rc<Suite> suite) -> FunctionSuite& {
    nested_.push_back(std::move(suite));
    return *this;
}

auto FunctionSuite::on_before_all(Hook hook) -> FunctionSuite& {
    before_ = std::move(hook);
    return *this;
}

auto FunctionSuite::on_after_all(Hook hook) -> FunctionSuite& {
    after_ = std::move(hook);
    return *this;
}

auto FunctionSuite::sequential() -> FunctionSuite& {
    parallel_ = false;
    return *this;
}

void FunctionSuite::run_test(const std::string& test_name, TestContext& ctx) {
    auto found = bodies_.find(test_name);
    if (found == bodies_.end()) {
        throw std::invalid_argument("no test named '" + test_name + "' in " + name_);
    }
    if (found->second) {
        found->second(ctx);
    }
}

void FunctionSuite::before_all() {
    if (before_) {
        before_();
    }
}

void FunctionSuite::after_all() {
    if (after_) {
        after_();
    }
}

} // namespace ordo::exec
