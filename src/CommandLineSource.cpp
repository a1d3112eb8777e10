#include "multiconf/CommandLineSource.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Log.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace multiconf {

// ============================================================================
// CommandLineSource
// ============================================================================

CommandLineSource::CommandLineSource(ItemSpecs items)
    : items_(std::move(items))
{}

std::string CommandLineSource::flag_name(const std::string& item_name) {
    std::string flag = item_name;
    std::replace(flag.begin(), flag.end(), '_', '-');
    return flag;
}

void CommandLineSource::add_options_to(cxxopts::Options& options, const std::string& group) {
    auto adder = options.add_options(group);
    for (const auto& item : items_) {
        const std::string flag = flag_name(item->name());
        if (flag.size() == 1) {
            // cxxopts would make it the short option -x
            logger()->warn("config item '{}' has no command-line flag: one-character names are not bound",
                           item->name());
            continue;
        }
        try {
            if (item->takes_value()) {
                adder(flag, item->help(), cxxopts::value<std::string>(), "VALUE");
            } else {
                adder(flag, item->help());
            }
            bound_flags_.insert(flag);
        } catch (const cxxopts::exceptions::specification& e) {
            // the item stays settable from other sources
            logger()->warn("config item '{}' has no command-line flag: {}", item->name(), e.what());
        }
    }
}

void CommandLineSource::notify_parsed(const cxxopts::ParseResult& result) {
    std::map<std::string, const ItemSpec*> by_flag;
    for (const auto& item : items_) {
        const std::string flag = flag_name(item->name());
        if (bound_flags_.count(flag) > 0) {
            by_flag[flag] = item.get();
        }
    }

    RawBatch batch;
    for (const auto& kv : result.arguments()) {
        auto it = by_flag.find(kv.key());
        if (it == by_flag.end()) {
            continue; // a flag the caller added for itself
        }
        const ItemSpec* item = it->second;
        batch[item->name()].push_back(item->takes_value() ? Slot::of(kv.value())
                                                          : Slot::marker());
    }
    parsed_ = std::move(batch);
}

RawBatch CommandLineSource::produce_raw_batch() {
    return parsed_;
}

// ============================================================================
// SimpleCommandLineSource
// ============================================================================

SimpleCommandLineSource::SimpleCommandLineSource(ItemSpecs items, CommandLineSourceOptions options)
    : binding_(std::move(items))
    , config_(std::move(options))
    , parser_(config_.program, config_.description)
{
    try {
        if (config_.add_help) {
            parser_.add_options()("h,help", "Show help");
        }
        binding_.add_options_to(parser_);
    } catch (const cxxopts::exceptions::exception& e) {
        throw SourceConstructionError("command-line source: " + std::string(e.what()));
    }
}

const cxxopts::ParseResult& SimpleCommandLineSource::parse() {
    if (result_) {
        return *result_;
    }

    std::vector<const char*> argv;
    argv.reserve(config_.arguments.size() + 1);
    argv.push_back(config_.program.c_str());
    for (const auto& arg : config_.arguments) {
        argv.push_back(arg.c_str());
    }

    try {
        auto parsed = parser_.parse(static_cast<int>(argv.size()), argv.data());
        if (!parsed.unmatched().empty()) {
            std::ostringstream oss;
            oss << "unrecognized arguments:";
            for (const auto& arg : parsed.unmatched()) oss << " " << arg;
            throw CommandLineError(config_.program, oss.str());
        }
        binding_.notify_parsed(parsed);
        result_.emplace(std::move(parsed));
    } catch (const cxxopts::exceptions::exception& e) {
        throw CommandLineError(config_.program, e.what());
    }

    logger()->debug("parsed {} command-line argument(s) for '{}'",
                    config_.arguments.size(), config_.program);
    return *result_;
}

RawBatch SimpleCommandLineSource::produce_raw_batch() {
    parse();
    return binding_.produce_raw_batch();
}

bool SimpleCommandLineSource::help_requested() const {
    return config_.add_help && result_ && result_->count("help") > 0;
}

} // namespace multiconf
