#include "commands.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "codec/record_codec.h"
#include "common/configuration.h"
#include "common/record.h"
#include "pool/double_buffer.h"
#include "pool/record_sequence.h"

namespace Recpool {

namespace {

constexpr char kProgram[] = "recpool-cli";
constexpr char kDescription[] = "A command line interface for the recpool library";

struct CommandInfo {
    const char* name;
    const char* summary;
    const char* usage;
    const char* option_group;   // cxxopts group with the command's flags, "" if none
};

const CommandInfo kCommands[] = {
    {"add", "Add two numbers together",
     "add <left> <right>\n\n  left   First number\n  right  Second number\n", ""},
    {"generate", "Generate a random data point and output as JSON",
     "generate\n", ""},
    {"to-json", "Convert data point to JSON",
     "to-json --id <ID> --value <VALUE> --timestamp <TIMESTAMP>\n", "to-json"},
    {"from-json", "Parse JSON string and display data point",
     "from-json <json>\n\n  json   JSON string to parse\n", ""},
    {"simulate", "Run producer/consumer steps through a record sequence or double buffer",
     "simulate [--config <FILE>] [--mode append|double] [--steps <N>] [--records-per-step <N>]\n",
     "simulate"},
};

const CommandInfo* FindCommand(const std::string& name) {
    for (const auto& cmd : kCommands) {
        if (name == cmd.name) return &cmd;
    }
    return nullptr;
}

void PrintUsage(const cxxopts::Options& options, std::ostream& out) {
    out << options.help({""}) << "\nCommands:\n";
    for (const auto& cmd : kCommands) {
        out << "  " << cmd.name;
        for (size_t pad = std::string(cmd.name).size(); pad < 12; ++pad) out << ' ';
        out << cmd.summary << "\n";
    }
}

void PrintCommandUsage(const cxxopts::Options& options, const CommandInfo& cmd, std::ostream& out) {
    out << cmd.summary << "\n\nUsage: " << kProgram << " " << cmd.usage;
    if (cmd.option_group[0] != '\0') {
        out << options.help({cmd.option_group});
    }
}

uint64_t ParseUnsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("invalid digit found in string '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("number too large to fit in target type: " + text);
    }
}

void RequireArgs(const std::vector<std::string>& args, size_t n, const CommandInfo& cmd) {
    if (args.size() != n) {
        throw std::invalid_argument(std::string(cmd.name) + " expects " + std::to_string(n) +
                                    " argument(s), got " + std::to_string(args.size()) +
                                    "\nUsage: " + kProgram + " " + cmd.usage);
    }
}

void RunSimulation(const cxxopts::ParseResult& result, std::ostream& out) {
    Configuration& config = Configuration::getInstance();

    if (result.count("config")) {
        const std::string path = result["config"].as<std::string>();
        if (!config.loadFromFile(path)) {
            std::string detail = "failed to load configuration " + path;
            for (const auto& e : config.getValidationErrors()) {
                detail += "; " + e;
            }
            throw std::runtime_error(detail);
        }
        FLAGS_v = config.getLogVerbosity();
    }

    auto& sim = config.config().simulation;
    if (result.count("mode")) sim.mode.set(result["mode"].as<std::string>());
    if (result.count("steps")) sim.steps.set(result["steps"].as<size_t>());
    if (result.count("records-per-step")) sim.records_per_step.set(result["records-per-step"].as<size_t>());

    if (!config.validate()) {
        std::string detail = "invalid configuration";
        for (const auto& e : config.getValidationErrors()) {
            detail += "; " + e;
        }
        throw std::invalid_argument(detail);
    }

    const std::string mode = sim.mode.get();
    const size_t steps = sim.steps.get();
    const size_t per_step = sim.records_per_step.get();

    LOG(INFO) << "Simulating " << steps << " steps of " << per_step << " records (mode=" << mode << ")";

    if (mode == "append") {
        RecordSequence sequence(config.getArenaBufferSize(), config.getArenaRangeCapacity());
        std::vector<Record> batch;
        batch.reserve(per_step);
        for (size_t s = 0; s < steps; ++s) {
            batch.clear();
            for (size_t i = 0; i < per_step; ++i) {
                batch.push_back(GenerateRandomRecord());
            }
            sequence.AddPoints(batch);
            sequence.Update();
            out << "step=" << sequence.Step() << " visible=" << sequence.Current().Size() << "\n";
        }
    } else {
        DoubleBuffer<Record> buffer(config.getPoolCapacity());
        for (size_t s = 0; s < steps; ++s) {
            auto& back = buffer.BackMut();
            for (size_t i = 0; i < per_step; ++i) {
                back.push_back(GenerateRandomRecord());
            }
            buffer.Swap();
            out << "step=" << buffer.Step() << " visible=" << buffer.Front().size() << "\n";
        }
        VLOG(1) << "Simulation done, pool_available=" << buffer.PoolAvailable();
    }
}

int Dispatch(const cxxopts::Options& options, const cxxopts::ParseResult& result,
             std::ostream& out) {
    if (!result.count("command")) {
        if (result.count("help")) {
            PrintUsage(options, out);
            return 0;
        }
        throw std::invalid_argument("no command given, see --help");
    }

    const std::string name = result["command"].as<std::string>();
    const CommandInfo* cmd = FindCommand(name);
    if (!cmd) {
        throw std::invalid_argument("unrecognized command '" + name + "'");
    }
    if (result.count("help")) {
        PrintCommandUsage(options, *cmd, out);
        return 0;
    }

    std::vector<std::string> args;
    if (result.count("args")) {
        args = result["args"].as<std::vector<std::string>>();
    }

    if (name == "add") {
        RequireArgs(args, 2, *cmd);
        out << Add(ParseUnsigned(args[0]), ParseUnsigned(args[1])) << "\n";
    } else if (name == "generate") {
        RequireArgs(args, 0, *cmd);
        out << ToJson(GenerateRandomRecord()) << "\n";
    } else if (name == "to-json") {
        RequireArgs(args, 0, *cmd);
        for (const char* flag : {"id", "value", "timestamp"}) {
            if (!result.count(flag)) {
                throw std::invalid_argument(std::string("missing required option --") + flag);
            }
        }
        Record record(result["id"].as<uint64_t>(),
                      result["value"].as<double>(),
                      result["timestamp"].as<std::string>());
        out << ToJson(record) << "\n";
    } else if (name == "from-json") {
        RequireArgs(args, 1, *cmd);
        Record record = FromJson(args[0]);
        out << "ID: " << record.id << "\n";
        out << "Value: " << FormatValue(record.value) << "\n";
        out << "Timestamp: " << record.timestamp << "\n";
    } else if (name == "simulate") {
        RequireArgs(args, 0, *cmd);
        RunSimulation(result, out);
    }
    return 0;
}

} // namespace

int RunCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    cxxopts::Options options(kProgram, kDescription);
    options.positional_help("<command> [args...]");

    options.add_options()
        ("h,help", "Print help")
        ("command", "Command to run", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>());
    options.add_options("to-json")
        ("id", "ID of the data point", cxxopts::value<uint64_t>())
        ("value", "Value of the data point", cxxopts::value<double>())
        ("timestamp", "Timestamp of the data point (ISO 8601 format)", cxxopts::value<std::string>());
    options.add_options("simulate")
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("mode", "append (record sequence) or double (double buffer)", cxxopts::value<std::string>())
        ("steps", "Number of commit steps", cxxopts::value<size_t>())
        ("records-per-step", "Records written per step", cxxopts::value<size_t>());
    options.parse_positional({"command", "args"});

    std::vector<const char*> argv;
    argv.reserve(args.size());
    for (const auto& a : args) {
        argv.push_back(a.c_str());
    }

    try {
        auto result = options.parse(static_cast<int>(argv.size()), argv.data());
        return Dispatch(options, result, out);
    } catch (const std::exception& e) {
        VLOG(1) << "Command failed: " << e.what();
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace Recpool
