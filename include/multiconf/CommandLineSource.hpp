/**
 * @file CommandLineSource.hpp
 * @brief Sources reading config values from command-line flags (cxxopts)
 *
 * Each item gets one long flag, its name with '_' replaced by '-':
 * - store, append: value-taking, `--log-file PATH` or `--log-file=PATH`
 * - store_const, store_true, store_false, count: presence only, `--verbose`
 *
 * Every occurrence is kept, in command-line order, so `--tag a --tag b`
 * yields two raw values and `--verbose --verbose` two presence markers.
 */

#ifndef MULTICONF_COMMANDLINESOURCE_HPP
#define MULTICONF_COMMANDLINESOURCE_HPP

#include "multiconf/Source.hpp"

#include <cxxopts.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace multiconf {

/**
 * @brief Binds items to a cxxopts parser owned by the caller.
 *
 * Use this when the program has flags of its own besides the items:
 * ```cpp
 * auto& cli = resolver.register_source<CommandLineSource>();
 * cxxopts::Options options("prog");
 * options.add_options()("x", "not an item");
 * cli.add_options_to(options);
 * cli.notify_parsed(options.parse(argc, argv));
 * auto values = resolver.resolve();
 * ```
 */
class CommandLineSource : public Source {
public:
    explicit CommandLineSource(ItemSpecs items);

    /// Register one flag per item on the caller's parser. Items are skipped,
    /// and left to other sources, when the name is one character long
    /// (cxxopts would bind it as a short option), gives no valid flag, or
    /// clashes with a flag the parser already has.
    void add_options_to(cxxopts::Options& options, const std::string& group = "");

    /// Record the raw values of the flags bound by add_options_to().
    /// Values of any other flag in the result are ignored.
    void notify_parsed(const cxxopts::ParseResult& result);

    /// Values from the last notify_parsed(); empty before the first one.
    RawBatch produce_raw_batch() override;

    /// "log_file" → "log-file"
    static std::string flag_name(const std::string& item_name);

private:
    ItemSpecs items_;
    std::set<std::string> bound_flags_;
    RawBatch parsed_;
};

/**
 * @brief Construction options for SimpleCommandLineSource.
 */
struct CommandLineSourceOptions {
    std::string program = "program";
    std::string description;
    /// Arguments after the program name, e.g. {"--c1", "v1"}.
    std::vector<std::string> arguments;
    /// Register -h/--help; see SimpleCommandLineSource::help_requested().
    bool add_help = true;
};

/**
 * @brief Owns its parser and argument vector.
 *
 * Parsing happens on the first parse() or produce_raw_batch() call and
 * is cached. Extra flags may be added through options() before that.
 */
class SimpleCommandLineSource : public Source {
public:
    SimpleCommandLineSource(ItemSpecs items, CommandLineSourceOptions options);

    cxxopts::Options& options() noexcept { return parser_; }

    /**
     * @brief Parse the arguments if not done yet.
     * @throws CommandLineError for unknown flags, missing flag values
     *         and stray positional arguments
     */
    const cxxopts::ParseResult& parse();

    RawBatch produce_raw_batch() override;

    /// True once parsed with -h/--help present (and add_help set).
    bool help_requested() const;

    std::string help() const { return parser_.help(); }

private:
    CommandLineSource binding_;
    CommandLineSourceOptions config_;
    cxxopts::Options parser_;
    std::optional<cxxopts::ParseResult> result_;
};

} // namespace multiconf

#endif // MULTICONF_COMMANDLINESOURCE_HPP
