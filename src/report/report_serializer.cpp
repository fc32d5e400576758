// src/report/report_serializer.cpp
#include "hc/report/report_serializer.hpp"
#include <cereal/archives/json.hpp>
#include <cereal/archives/portable_binary.hpp>
#include <fstream>
#include <stdexcept>

namespace hc {

void save_report(const Report& report, std::ostream& os, ReportFormat format) {
    if (format == ReportFormat::Json) {
        cereal::JSONOutputArchive archive(os);
        archive(cereal::make_nvp("report", report));
    } else {
        cereal::PortableBinaryOutputArchive archive(os);
        archive(report);
    }
}

Report load_report(std::istream& is, ReportFormat format) {
    Report report;
    if (format == ReportFormat::Json) {
        cereal::JSONInputArchive archive(is);
        archive(cereal::make_nvp("report", report));
    } else {
        cereal::PortableBinaryInputArchive archive(is);
        archive(report);
    }
    return report;
}

void save_report(const Report& report, const std::string& path, ReportFormat format) {
    try {
        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for writing: " + path);
        }
        save_report(report, file, format);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to save report: " + std::string(e.what()));
    }
}

Report load_report(const std::string& path, ReportFormat format) {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for reading: " + path);
        }
        return load_report(file, format);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load report: " + std::string(e.what()));
    }
}

} // namespace hc
