#include "report/Report.hh"

#include <filesystem>
#include <fstream>
#include <optional>

#include <cereal/archives/json.hpp>

#include "util/log.hh"

using std::ifstream;
using std::ofstream;

bool save_report(const fs::path& path, const ReportRecord& record) noexcept {
  try {
    ofstream f(path, std::ios::trunc);
    if (!f) return false;

    {
      // The archive only finishes the JSON document when it is destroyed
      cereal::JSONOutputArchive archive(f);
      archive(cereal::make_nvp("report", record));
    }

    f.flush();
    return static_cast<bool>(f);

  } catch (cereal::Exception& e) {
    WARN << "Failed to serialize report: " << e.what();
    return false;
  }
}

std::optional<ReportRecord> load_report(const fs::path& path) noexcept {
  try {
    ifstream f(path);
    if (!f) return std::nullopt;

    cereal::JSONInputArchive archive(f);

    ReportRecord record;
    archive(cereal::make_nvp("report", record));
    return record;

  } catch (cereal::Exception& e) {
    WARN << "Failed to load report from " << path << ": " << e.what();
    return std::nullopt;
  }
}
