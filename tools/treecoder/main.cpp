// treecoder - Inspect YAML/JSON documents through the decoder
//
// Usage:
//   treecoder dump <file>          Print every leaf with its coding path
//   treecoder get <file> <path>    Print the value at a coding path
//
#include <fmt/core.h>
#include <fmt/format.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "treecoder/basic/diagnostic_printer.hpp"
#include "treecoder/decoder/path_lookup.hpp"
#include "treecoder/io/config_loader.hpp"
#include "treecoder/treecoder.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "treecoder v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  dump <file>              Print every leaf value with its coding path\n"
            << "  get <file> <path>        Print the value at a coding path (e.g. servers[0].host)\n\n"
            << "Options:\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

std::string render_scalar(const treecoder::Value & value)
{
  switch (value.kind()) {
    case treecoder::ValueKind::Null:
      return "null";
    case treecoder::ValueKind::Bool:
      return value.as_bool() ? "true" : "false";
    case treecoder::ValueKind::Integer:
      return std::to_string(value.as_integer());
    case treecoder::ValueKind::Float:
      return fmt::format("{}", value.as_float());
    case treecoder::ValueKind::String:
      return fmt::format("\"{}\"", value.as_string());
    case treecoder::ValueKind::Keyed:
      return fmt::format("{{...}} ({} keys)", value.size());
    case treecoder::ValueKind::Ordered:
      return fmt::format("[...] ({} elements)", value.size());
  }
  return "?";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  bool use_color = true;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];
  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--no-color") {
      args.use_color = false;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.positional.push_back(std::move(arg));
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Walk the tree through the container views, printing every leaf
treecoder::DecodeResult<size_t> dump_value(const treecoder::Decoder & decoder)
{
  const treecoder::Value & value = decoder.value();

  if (value.is_keyed()) {
    auto keyed = decoder.keyed_container();
    if (!keyed) return std::move(keyed).error();

    size_t leaves = 0;
    for (const auto & key : keyed->all_keys()) {
      auto child = keyed->element(key);
      if (!child) return std::move(child).error();
      auto dumped = dump_value(
        treecoder::Decoder(*child, keyed->coding_path().appending_field(key)));
      if (!dumped) return dumped;
      leaves += *dumped;
    }
    return leaves;
  }

  if (value.is_ordered()) {
    auto ordered = decoder.ordered_container();
    if (!ordered) return std::move(ordered).error();

    size_t leaves = 0;
    while (!ordered->is_at_end()) {
      const auto path = ordered->coding_path().appending_index(ordered->current_index());
      auto child = ordered->decode<treecoder::Value>();
      if (!child) return std::move(child).error();
      auto dumped = dump_value(treecoder::Decoder(*child, path));
      if (!dumped) return dumped;
      leaves += *dumped;
    }
    return leaves;
  }

  fmt::print(
    "{}: {} = {}\n", decoder.coding_path().to_string(), treecoder::to_string(value.kind()),
    render_scalar(value));
  return size_t{1};
}

int cmd_dump(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: treecoder dump <file>\n";
    return 1;
  }

  const std::string & input_file = args.positional[0];
  treecoder::DiagnosticPrinter printer(std::cerr, args.use_color);

  const auto loaded = treecoder::load_value_file(fs::path(input_file));
  if (!loaded.success) {
    printer.print_error(loaded.error, input_file);
    return 1;
  }

  const auto leaves = dump_value(treecoder::Decoder(loaded.value, treecoder::CodingPath{}));
  if (!leaves) {
    printer.print(leaves.error(), input_file);
    return 1;
  }
  return 0;
}

int cmd_get(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: input file and path required\n";
    std::cerr << "usage: treecoder get <file> <path>\n";
    return 1;
  }

  const std::string & input_file = args.positional[0];
  treecoder::DiagnosticPrinter printer(std::cerr, args.use_color);

  const auto target = treecoder::CodingPath::parse(args.positional[1]);
  if (!target) {
    printer.print_error(fmt::format("malformed coding path '{}'", args.positional[1]));
    return 1;
  }

  const auto loaded = treecoder::load_value_file(fs::path(input_file));
  if (!loaded.success) {
    printer.print_error(loaded.error, input_file);
    return 1;
  }

  const auto found = treecoder::lookup_path(loaded.value, *target);
  if (!found) {
    printer.print(found.error(), input_file);
    return 1;
  }

  fmt::print("{}\n", render_scalar(*found));
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  // Colors only when stderr is a terminal
  if (isatty(fileno(stderr)) == 0) {
    args.use_color = false;
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }
  if (args.command == "get") {
    return cmd_get(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
