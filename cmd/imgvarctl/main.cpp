#include <arrow/io/file.h>
#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "imgvar/v1.hpp"
#include "args.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

using namespace imgvar::v1;
using imgvar::cli::ParseDimension;
using imgvar::cli::ParseFormat;
using imgvar::cli::ParseId;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  imgvarctl --config <config.yaml> import <file> [png|gif|jpeg]\n"
            << "  imgvarctl --config <config.yaml> resize <id> <width> <height>\n"
            << "  imgvarctl --config <config.yaml> show <id>\n"
            << "  imgvarctl --config <config.yaml> locator <id>\n"
            << "  imgvarctl --config <config.yaml> children <id>\n";
}

static void PrintJson(const google::protobuf::Message& message) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("json encode: " + std::string(status.message()));
  }
  std::cout << json << "\n";
}

static int Run(imgvar::factory::Application& app, const std::string& cmd, int argc, char** argv) {
  auto& resolver = *app.resolver;

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 1) return 1;

    const std::filesystem::path path = argv[0];
    auto format = ParseFormat(argc >= 2 ? std::string(argv[1]) : path.extension().string());
    if (!format.has_value()) {
      std::cerr << "cannot tell the image format of " << path << "; pass png, gif or jpeg\n";
      return 1;
    }

    auto file  = imgvar::storage::common::Unwrap(arrow::io::ReadableFile::Open(path.string()));
    auto bytes = imgvar::storage::common::ReadAll(file);

    PrintJson(resolver.Describe(resolver.ImportOriginal(bytes, *format)));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resize") {
    if (argc < 3) return 1;

    auto variant = resolver.GetWithSize(ParseId(argv[0]), ParseDimension(argv[1]), ParseDimension(argv[2]));
    PrintJson(resolver.Describe(variant));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 1) return 1;

    PrintJson(resolver.Describe(resolver.Find(ParseId(argv[0]))));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "locator") {
    if (argc < 1) return 1;

    std::cout << resolver.GetLocator(resolver.Find(ParseId(argv[0]))) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "children") {
    if (argc < 1) return 1;

    for (const auto& child : resolver.Children(ParseId(argv[0]))) {
      PrintJson(resolver.Describe(child));
    }
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = imgvar::config::ConfigLoader::LoadFromYaml(config_path);
    imgvar::observability::InitializeLogging(config);

    auto app = imgvar::factory::Build(config);

    const int rc = Run(app, cmd, argc - 4, argv + 4);
    if (rc == 1) Usage();

    imgvar::observability::ShutdownLogging();
    return rc;
  } catch (const imgvar::util::ImageError& e) {
    IMGVAR_LOG_ERROR("Request failed", {imgvar::observability::StringField("kind", imgvar::util::ToString(e.kind())),
                                        imgvar::observability::StringField("error", e.what())});
    std::cerr << imgvar::util::ToString(e.kind()) << ": " << e.what() << "\n";
    imgvar::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    IMGVAR_LOG_ERROR("Fatal error", {imgvar::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    imgvar::observability::ShutdownLogging();
    return 2;
  }
}
