#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include "logging.hpp"
#include "tracker/tracker_interface.hpp"

using namespace std;
using json = nlohmann::json;

namespace cache
{
    namespace calibration
    {
        const int VERSION = 1;
        const string DEFAULT_PATH = "cache/calibration.json";

        inline json toJson(const CalibrationData &data)
        {
            return json{
                {"version", VERSION},
                {"center", {{"x", data.center.x}, {"y", data.center.y}}},
                {"radius", data.radius},
                {"timestamp", data.timestamp},
                {"referenceFrame", data.hasReferenceFrame() ? json(data.reference_frame) : json(nullptr)}};
        }

        // False on a missing field or a version this build cannot read
        inline bool fromJson(const json &document, CalibrationData &data)
        {
            try
            {
                if (document.value("version", 0) != VERSION)
                {
                    log_warning("Incompatible calibration version: " + document.value("version", json(0)).dump() + ". Expected " + to_string(VERSION));
                    return false;
                }

                CalibrationData parsed;
                parsed.center.x = document.at("center").at("x").get<float>();
                parsed.center.y = document.at("center").at("y").get<float>();
                parsed.radius = document.at("radius").get<double>();
                parsed.timestamp = document.value("timestamp", int64_t(0));

                const json &reference = document.value("referenceFrame", json(nullptr));
                if (reference.is_string())
                {
                    parsed.reference_frame = reference.get<string>();
                }

                data = parsed;
                return true;
            }
            catch (const json::exception &e)
            {
                log_warning("Malformed calibration document: " + string(e.what()));
                return false;
            }
        }

        inline bool load(const string &filename, CalibrationData &data)
        {
            ifstream file(filename);
            if (!file)
            {
                log_debug("No calibration file found, a new one will be created: " + filename);
                return false;
            }

            json document = json::parse(file, nullptr, false);
            if (document.is_discarded())
            {
                log_warning("Calibration file is not valid JSON: " + filename);
                return false;
            }

            if (!fromJson(document, data))
            {
                return false;
            }

            log_info("Loaded calibration from " + filename);
            return true;
        }

        inline bool save(const string &filename, const CalibrationData &data)
        {
            filesystem::path parent = filesystem::path(filename).parent_path();
            if (!parent.empty())
            {
                error_code ec;
                filesystem::create_directories(parent, ec);
                if (ec)
                {
                    log_error("Cannot create calibration directory " + parent.string() + ": " + ec.message());
                    return false;
                }
            }

            ofstream file(filename, ios::trunc);
            if (!file)
            {
                log_error("Failed to open file for writing: " + filename);
                return false;
            }

            file << toJson(data).dump(2);
            if (!file.good())
            {
                log_error("Failed to write calibration data");
                return false;
            }

            log_debug("Saved calibration to " + filename);
            return true;
        }

    } // namespace calibration
} // namespace cache

// CalibrationStore over a JSON file
class FileCalibrationStore : public CalibrationStore
{
public:
    explicit FileCalibrationStore(const string &filename = cache::calibration::DEFAULT_PATH) : filename_(filename) {}

    bool load(CalibrationData &data) override { return cache::calibration::load(filename_, data); }
    bool save(const CalibrationData &data) override { return cache::calibration::save(filename_, data); }

    const string &filename() const { return filename_; }

private:
    string filename_;
};
