#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <args.hxx>
#include <redlog.hpp>

#include <c3rt/utils/index_list.hpp>

#include "commands/patch.hpp"
#include "commands/scan.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() {
  // map verbosity levels: info → verbose → trace → debug → pedantic
  int verbosity = args::get(verbosity_flag);
  redlog::set_level(redlog::level::info);
  if (verbosity == 1) {
    redlog::set_level(redlog::level::verbose);
  } else if (verbosity == 2) {
    redlog::set_level(redlog::level::trace);
  } else if (verbosity == 3) {
    redlog::set_level(redlog::level::debug);
  } else if (verbosity >= 4) {
    redlog::set_level(redlog::level::pedantic);
  }
}
} // namespace cli

namespace {
auto log_main = redlog::get_logger("c3rtx");
int g_exit_code = 0;
} // namespace

void cmd_scan(args::Subparser& parser) {
  args::ValueFlag<std::string> input(parser, "input", "input file path", {'i', "input"}, args::Options::Required);
  args::Flag dump(parser, "dump", "hexdump the head of each bundle", {"dump"});
  parser.Parse();

  cli::apply_verbosity();
  g_exit_code = c3rtx::commands::scan(args::get(input), args::get(dump));
}

void cmd_patch(args::Subparser& parser) {
  args::ValueFlag<std::string> input(parser, "input", "path to original binary", {'i', "input"}, args::Options::Required);
  args::ValueFlag<std::string> certs(
      parser, "certs", "path to replacement PEM bundle", {'c', "certs"}, args::Options::Required
  );
  args::ValueFlag<std::string> output(parser, "output", "path for patched binary", {'o', "output"}, args::Options::Required);
  args::ValueFlag<std::string> index(
      parser, "LIST", "comma-separated bundle numbers to patch (default: all)", {"index"}
  );
  args::Flag strict(parser, "strict", "abort if replacement is shorter than original (no padding)", {"strict"});
  parser.Parse();

  cli::apply_verbosity();

  std::optional<std::vector<int64_t>> indices;
  if (index) {
    indices = c3rt::utils::parse_index_list(args::get(index));
    if (!indices) {
      log_main.err("invalid index list", redlog::field("index", args::get(index)));
      std::cerr << "error: --index expects comma-separated integers" << std::endl;
      g_exit_code = 1;
      return;
    }
  }

  g_exit_code = c3rtx::commands::patch(args::get(input), args::get(certs), args::get(output), indices, args::get(strict));
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "c3rtx - embedded certificate bundle patcher", "locate and replace PEM certificate bundles inside binaries"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command scan_cmd(commands, "scan", "list certificate bundles found in a binary", &cmd_scan);
  args::Command patch_cmd(commands, "patch", "replace certificate bundles with a new bundle", &cmd_patch);

  try {
    parser.ParseCLI(argc, argv);
  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
