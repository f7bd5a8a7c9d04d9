#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "varclip/cas.hpp"
#include "varclip/hash.hpp"
#include "varclip/jsonlite.hpp"
#include "varclip/observability.hpp"
#include "varclip/offload.hpp"
#include "varclip/segment.hpp"
#include "varclip/size_estimator.hpp"
#include "varclip/truncator.hpp"
#include "varclip/types.hpp"
#include "varclip/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace {

using varclip::jsonlite::Object;
using varclip::jsonlite::Value;

class CliError : public varclip::Error {
 public:
  using varclip::Error::Error;
};

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    throw CliError(varclip::ErrorCode::json_parse_error,
                   "cannot open input file: " + path);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

Value read_json(const std::string &path) {
  std::optional<varclip::jsonlite::JsonError> err;
  auto v = varclip::jsonlite::parse_value(read_file(path), &err);
  if (err)
    throw CliError(varclip::ErrorCode::json_parse_error,
                   err->code + ": " + err->message);
  return v;
}

std::size_t flag_size(const char *name, const char *text) {
  return varclip::parse_limit(name, text);
}

Value optional_object(const std::optional<Object> &o) {
  return o ? Value{*o} : Value{nullptr};
}

Value optional_string(const std::optional<std::string> &s) {
  return s ? Value{*s} : Value{nullptr};
}

std::string persisted_to_json(const varclip::PersistedExecution &rec) {
  Object o;
  o["id"] = rec.id;
  o["node_id"] = rec.node_id;
  o["title"] = rec.title;
  o["inputs"] = optional_object(rec.inputs);
  o["outputs"] = optional_object(rec.outputs);
  o["inputs_truncated"] = rec.inputs_truncated();
  o["outputs_truncated"] = rec.outputs_truncated();
  if (rec.offload) {
    Object off;
    off["execution_id"] = rec.offload->execution_id;
    off["inputs_file_id"] = optional_string(rec.offload->inputs_file_id);
    off["outputs_file_id"] = optional_string(rec.offload->outputs_file_id);
    o["offload"] = off;
  } else {
    o["offload"] = nullptr;
  }
  return varclip::jsonlite::to_json(o);
}

varclip::SegmentType parse_type(const std::string &t, const Value &v) {
  if (t == "auto")
    return varclip::build_segment(v).type;
  if (t == "string")
    return varclip::SegmentType::string;
  if (t == "array")
    return varclip::SegmentType::array;
  if (t == "object")
    return varclip::SegmentType::object;
  throw CliError(varclip::ErrorCode::config_invalid,
                 "--type must be auto|string|array|object, got " + t);
}

void print_usage() {
  std::cerr << "usage: varclip <health|estimate|truncate|offload|recover> "
               "[options]\n";
}

int run(const std::string &cmd, int argc, char **argv) {
  if (cmd == "health") {
    const auto h = varclip::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version << "\"";
    std::cout << ",\"compression_capabilities\":[\"identity\"";
    if (varclip::cas_zstd_available())
      std::cout << ",\"zstd\"";
    std::cout << "]";
    std::cout << ",\"version\":"
              << varclip::version::manifest_to_json(
                     varclip::version::current_manifest(PROJECT_VERSION));
    std::cout << "}" << "\n";
    return 0;
  }

  if (cmd == "estimate") {
    std::string in;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--in" && i + 1 < argc)
        in = argv[++i];
    }
    const auto v = read_json(in);
    std::cout << "{\"bytes\":" << varclip::estimate_json_size(v) << "}\n";
    return 0;
  }

  if (cmd == "truncate") {
    std::string in, type = "auto";
    auto cfg = varclip::TruncatorConfig::from_env();
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--in" && i + 1 < argc)
        in = argv[++i];
      else if (a == "--type" && i + 1 < argc)
        type = argv[++i];
      else if (a == "--max-size" && i + 1 < argc)
        cfg.max_size_bytes = flag_size("--max-size", argv[++i]);
      else if (a == "--string-limit" && i + 1 < argc)
        cfg.string_length_limit = flag_size("--string-limit", argv[++i]);
      else if (a == "--array-limit" && i + 1 < argc)
        cfg.array_element_limit = flag_size("--array-limit", argv[++i]);
    }
    const varclip::VariableTruncator truncator(cfg);
    auto v = read_json(in);
    const auto seg_type = parse_type(type, v);

    varclip::TruncationEvent ev;
    ev.field = "value";
    ev.segment_type = varclip::to_string(seg_type);
    ev.original_bytes = varclip::estimate_json_size(v);
    varclip::TruncationResult res;
    {
      varclip::ScopeTimer timer(ev.duration_ns);
      res = truncator.truncate(varclip::Segment{seg_type, std::move(v)});
    }
    ev.truncated = res.truncated;
    ev.collapsed = !varclip::is_exempt(seg_type) &&
                   res.result.type != seg_type;
    ev.result_bytes = varclip::estimate_json_size(res.result.value);
    varclip::emit_truncation_event(ev);

    Object out;
    out["truncated"] = res.truncated;
    out["type"] = varclip::to_string(res.result.type);
    out["result"] = res.result.value;
    std::cout << varclip::jsonlite::to_json(out) << "\n";
    return 0;
  }

  if (cmd == "offload") {
    std::string in, cas_dir = ".varclip/cas/v1", compress = "off";
    auto cfg = varclip::OffloadConfig::from_env();
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--in" && i + 1 < argc)
        in = argv[++i];
      else if (a == "--cas" && i + 1 < argc)
        cas_dir = argv[++i];
      else if (a == "--threshold" && i + 1 < argc)
        cfg.threshold_bytes = flag_size("--threshold", argv[++i]);
      else if (a == "--max-size" && i + 1 < argc)
        cfg.truncator.max_size_bytes = flag_size("--max-size", argv[++i]);
      else if (a == "--compress" && i + 1 < argc)
        compress = argv[++i];
    }
    const auto doc = read_json(in);
    const auto *obj = std::get_if<Object>(&doc.v);
    if (obj == nullptr)
      throw CliError(varclip::ErrorCode::json_parse_error,
                     "execution document must be an object");

    varclip::NodeExecution execution;
    execution.id = varclip::jsonlite::get_string(*obj, "id");
    execution.node_id = varclip::jsonlite::get_string(*obj, "node_id");
    execution.title = varclip::jsonlite::get_string(*obj, "title");
    execution.inputs = varclip::jsonlite::get_object(*obj, "inputs");
    execution.outputs = varclip::jsonlite::get_object(*obj, "outputs");

    auto storage = std::make_shared<varclip::CasBlobStorage>(
        std::make_shared<varclip::CasStore>(cas_dir),
        varclip::parse_codec(compress));
    const varclip::OffloadCoordinator coordinator(storage, cfg);
    std::cout << persisted_to_json(coordinator.to_persisted(execution))
              << "\n";
    return 0;
  }

  if (cmd == "recover") {
    std::string file_id, cas_dir = ".varclip/cas/v1";
    for (int i = 2; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--file-id" && i + 1 < argc)
        file_id = argv[++i];
      else if (a == "--cas" && i + 1 < argc)
        cas_dir = argv[++i];
    }
    auto storage = std::make_shared<varclip::CasBlobStorage>(
        std::make_shared<varclip::CasStore>(cas_dir));
    const varclip::OffloadCoordinator coordinator(storage);
    const auto original = coordinator.recover(file_id);
    if (!original)
      throw CliError(varclip::ErrorCode::cas_integrity_failed,
                     "blob missing or failed verification: " + file_id);
    std::cout << varclip::jsonlite::to_json(*original) << "\n";
    return 0;
  }

  print_usage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  if (argc >= 2)
    cmd = argv[1];
  if (cmd.empty()) {
    print_usage();
    return 1;
  }

  try {
    return run(cmd, argc, argv);
  } catch (const varclip::Error &e) {
    Object err;
    err["error"] = varclip::to_string(e.code());
    err["detail"] = e.what();
    std::cerr << varclip::jsonlite::to_json(err) << "\n";
    return 2;
  } catch (const std::exception &e) {
    // Filesystem failures from the CAS root, allocation failures.
    Object err;
    err["error"] = "internal";
    err["detail"] = e.what();
    std::cerr << varclip::jsonlite::to_json(err) << "\n";
    return 2;
  }
}
