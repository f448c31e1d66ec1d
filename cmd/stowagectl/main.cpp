#include <arrow/io/file.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  stowagectl <config.yaml|-> upload <local-file> <path> <owner> <folder> [content-type]\n"
            << "  stowagectl <config.yaml|-> read <path> <out-file>\n"
            << "  stowagectl <config.yaml|-> stat <path>\n"
            << "  stowagectl <config.yaml|-> quota <owner> [delta_bytes]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) return message.ShortDebugString();
  return json;
}

static int Fail(const stowage::util::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

static void Shutdown() {
  stowage::observability::ShutdownLogging();
  stowage::observability::ShutdownMetrics();
  stowage::observability::ShutdownTracing();
}

static int Run(stowage::factory::Application& app, int argc, char** argv) {
  const std::string cmd = argv[2];

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    auto source = arrow::io::ReadableFile::Open(argv[3]);
    if (!source.ok()) {
      std::cerr << "cannot open " << argv[3] << ": " << source.status().ToString() << "\n";
      return 1;
    }

    stowage::core::FileRecord record;
    record.owner_id  = argv[5];
    record.folder_id = argv[6];
    record.file_id   = argv[4];
    if (argc >= 8) record.content_type = argv[7];

    auto result = app.facade->Upload(*source, argv[4], record);
    if (!result.ok()) return Fail(result.status());

    std::cout << "path:       " << result->descriptor.path << "\n"
              << "version:    " << result->descriptor.version_id << "\n"
              << "etag:       " << result->descriptor.etag << "\n"
              << "size_bytes: " << result->descriptor.size_bytes << "\n"
              << "strategy:   " << stowage::upload::ToString(result->strategy) << "\n"
              << "parts:      " << result->part_count << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "read") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto bytes = app.facade->Fetch(argv[3]);
    if (!bytes.ok()) return Fail(bytes.status());

    auto out = arrow::io::FileOutputStream::Open(argv[4]);
    if (!out.ok()) {
      std::cerr << "cannot open " << argv[4] << ": " << out.status().ToString() << "\n";
      return 1;
    }
    auto written = (*out)->Write(*bytes);
    if (written.ok()) written = (*out)->Close();
    if (!written.ok()) {
      std::cerr << "writing " << argv[4] << ": " << written.ToString() << "\n";
      return 1;
    }

    std::cout << (*bytes)->size() << " bytes written to " << argv[4] << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stat") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto meta = app.facade->Read(argv[3]);
    if (!meta.ok()) return Fail(meta.status());

    std::cout << ToJson(*meta) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "quota") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    if (argc >= 5) {
      auto updated = app.facade->UpdateQuota(argv[3], std::stoll(argv[4]));
      if (!updated.ok()) return Fail(updated.status());
      std::cout << ToJson(*updated) << "\n";
      return 0;
    }

    auto usage = app.facade->ReadQuota(argv[3]);
    if (!usage.ok()) return Fail(usage.status());
    std::cout << ToJson(*usage) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    const std::string config_path = argv[1];
    auto config = config_path == "-" ? stowage::config::ConfigLoader::Defaults() : stowage::config::ConfigLoader::LoadFromYaml(config_path);

    stowage::observability::InitializeTracing(config);
    stowage::observability::InitializeMetrics(config);
    stowage::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app  = stowage::factory::Build(config);
    int  code = Run(app, argc, argv);

    app.workers->Stop();
    Shutdown();
    return code;
  } catch (const std::exception& e) {
    STOWAGE_LOG_ERROR("Fatal error", {stowage::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
