#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "expr.hpp"
#include "interpreter.hpp"

namespace calq
{
// Expressions that evaluated successfully, oldest first, without duplicates.
struct History
{
    void push(ExprPtr expr);
    bool contains(const Expr& expr) const;
    void clear();

    std::vector<ExprPtr> entries;
};

struct Response
{
    bool ok;
    std::string text;  // formatted result, or "ERROR: ..." when !ok
};

// One calculator session: an interpreter, its history and optionally the rc
// file the environment is loaded from and saved to.
class Session
{
public:
    Session() = default;

    // Loads the rc file, creating it when missing. Throws RcError on any
    // problem, in which case nothing is loaded.
    explicit Session(std::filesystem::path rc_file);

    Response eval(std::string_view line);

    // Rewrites the rc file from the current environment.
    // Throws std::runtime_error if there is no rc file or it cannot be written.
    void save() const;

    void reset_vars();
    void reset_history();

    const History& history() const;
    Interpreter& interpreter();
    const Interpreter& interpreter() const;
    const std::optional<std::filesystem::path>& rc_file() const;

private:
    Interpreter interp;
    History hist;
    std::optional<std::filesystem::path> rc_path;
};

// Applies every statement of an rc file to `interpreter`, in order.
void load_rc(std::istream& is, Interpreter& interpreter, std::string_view source_name);

}  // namespace calq
