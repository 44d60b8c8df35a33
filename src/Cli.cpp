/**
 * @file Cli.cpp
 * @brief Command dispatch for the pathmap tool
 */

#include "pathmap/Cli.hpp"
#include "pathmap/Document.hpp"
#include "pathmap/Exceptions.hpp"
#include "pathmap/Parse.hpp"
#include "pathmap/PathMap.hpp"

#include <cxxopts.hpp>

#include <optional>
#include <ostream>
#include <utility>

namespace pathmap {

namespace {

const char* const kCommandHelp =
    "Commands:\n"
    "  fetch PATH            print the value at PATH\n"
    "  get PATH [DEFAULT]    print the value at PATH, or DEFAULT (null) on any error\n"
    "  exists PATH           print true/false\n"
    "  validate PATH         print ok, or the reason PATH can't be traversed\n"
    "  put PATH VALUE        overwrite an existing value\n"
    "  put-auto PATH VALUE   set a value, creating intermediate maps\n"
    "  put-new PATH VALUE    set a value only where none exists\n"
    "  put-new-auto PATH VALUE\n"
    "  ensure PATH VALUE     set VALUE only if PATH has no value yet\n"
    "  dump                  print the whole document\n"
    "PATH is dot notation (a.b.c) or a JSON array ('[\"a\",\"b\"]').\n"
    "--write and --out apply to put*, ensure only.\n";

using WriteOp = Result<Value> (*)(const Value&, const Path&, Value);

const std::vector<std::pair<std::string, WriteOp>>& write_ops() {
    static const std::vector<std::pair<std::string, WriteOp>> ops = {
        {"put", &put},
        {"put-auto", &put_auto},
        {"put-new", &put_new},
        {"put-new-auto", &put_new_auto},
    };
    return ops;
}

bool produces_tree(const std::string& cmd) {
    if (cmd == "ensure") return true;
    for (const auto& entry : write_ops()) {
        if (entry.first == cmd) return true;
    }
    return false;
}

struct Output {
    std::string format = "json";
    bool write_back = false;
    std::optional<std::string> out_file;
    std::optional<std::string> file;
};

class Session {
public:
    Session(Output opts, std::ostream& out, std::ostream& err)
        : opts_(std::move(opts)), out_(out), err_(err) {}

    void print_value(const Value& v) {
        if (opts_.format == "toml") {
            out_ << to_toml_string(v) << "\n";
        } else {
            out_ << to_json_string(v) << "\n";
        }
    }

    int report(const Error& e) {
        err_ << "Error: " << e.message() << "\n";
        return kExitFailure;
    }

    // Prints or stores the tree produced by a write command.
    int emit_tree(const Result<Value>& r) {
        if (!r) return report(r.error());

        const Value& tree = r.value();
        const std::optional<std::string>& target = opts_.write_back ? opts_.file : opts_.out_file;
        if (target) {
            save_document(*target, tree);
            out_ << "Wrote " << *target << "\n";
        } else {
            print_value(tree);
        }
        return kExitOk;
    }

    int dispatch(const std::vector<std::string>& cmdv) {
        const std::string& cmd = cmdv[0];
        const std::size_t nargs = cmdv.size() - 1;

        auto has_args = [&](std::size_t min, std::size_t max) {
            if (nargs < min || nargs > max) {
                err_ << "Error: wrong number of arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        const Value doc = opts_.file ? load_document(*opts_.file) : empty_map();

        if (cmd == "dump") {
            if (!has_args(0, 0)) return kExitUsage;
            print_value(doc);
            return kExitOk;
        }

        if (cmd == "fetch") {
            if (!has_args(1, 1)) return kExitUsage;
            auto r = fetch(doc, parse_path_arg(cmdv[1]));
            if (!r) return report(r.error());
            out_ << r.value().dump(2) << "\n";
            return kExitOk;
        }

        if (cmd == "get") {
            if (!has_args(1, 2)) return kExitUsage;
            Value fallback = nargs == 2 ? parse_value(cmdv[2]) : Value(nullptr);
            out_ << pathmap::get(doc, parse_path_arg(cmdv[1]), fallback).dump(2) << "\n";
            return kExitOk;
        }

        if (cmd == "exists") {
            if (!has_args(1, 1)) return kExitUsage;
            bool found = exists(doc, parse_path_arg(cmdv[1]));
            out_ << (found ? "true" : "false") << "\n";
            return found ? kExitOk : kExitFailure;
        }

        if (cmd == "validate") {
            if (!has_args(1, 1)) return kExitUsage;
            Status s = validate_path(doc, parse_path_arg(cmdv[1]));
            if (!s) return report(s.error());
            out_ << "ok\n";
            return kExitOk;
        }

        for (const auto& [name, op] : write_ops()) {
            if (cmd != name) continue;
            if (!has_args(2, 2)) return kExitUsage;
            return emit_tree(op(doc, parse_path_arg(cmdv[1]), parse_value(cmdv[2])));
        }

        if (cmd == "ensure") {
            if (!has_args(2, 2)) return kExitUsage;
            const Value init = parse_value(cmdv[2]);
            return emit_tree(ensure(doc, parse_path_arg(cmdv[1]), [&init]() { return init; }));
        }

        err_ << "Unknown command: " << cmd << "\n" << kCommandHelp;
        return kExitUsage;
    }

private:
    Output opts_;
    std::ostream& out_;
    std::ostream& err_;
};

} // anonymous namespace

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("pathmap", "Read, check and edit JSON/TOML documents by path");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "JSON/TOML document to operate on (default: empty map)", cxxopts::value<std::string>())
            ("w,write", "Write the resulting tree back to --file")
            ("o,out", "Write the resulting tree to this file", cxxopts::value<std::string>())
            ("format", "Output format for printed trees: json|toml", cxxopts::value<std::string>()->default_value("json"))
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        std::vector<const char*> argv;
        argv.reserve(args.size() + 1);
        argv.push_back("pathmap");
        for (const auto& a : args) argv.push_back(a.c_str());

        auto result = options.parse(static_cast<int>(argv.size()), argv.data());
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n" << kCommandHelp;
            return result.count("help") ? kExitOk : kExitUsage;
        }

        Output opts;
        opts.format = result["format"].as<std::string>();
        if (opts.format != "json" && opts.format != "toml") {
            err << "Error: --format must be json or toml\n";
            return kExitUsage;
        }
        if (result.count("file")) opts.file = result["file"].as<std::string>();
        if (result.count("out")) opts.out_file = result["out"].as<std::string>();
        opts.write_back = result.count("write") > 0;

        if (opts.write_back && !opts.file) {
            err << "Error: --write requires --file\n";
            return kExitUsage;
        }
        if (opts.write_back && opts.out_file) {
            err << "Error: --write and --out cannot be combined\n";
            return kExitUsage;
        }

        const auto cmdv = result["command"].as<std::vector<std::string>>();
        if ((opts.write_back || opts.out_file) && !produces_tree(cmdv[0])) {
            err << "Error: --write/--out not supported by command '" << cmdv[0] << "'\n";
            return kExitUsage;
        }

        Session session(std::move(opts), out, err);
        return session.dispatch(cmdv);

    } catch (const cxxopts::exceptions::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitFailure;
    }
}

} // namespace pathmap
