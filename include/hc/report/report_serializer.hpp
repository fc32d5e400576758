// include/hc/report/report_serializer.hpp
#pragma once

#include "hc/scan/aggregator.hpp"
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <iosfwd>
#include <string>

namespace hc {

template <class Archive>
void serialize(Archive& archive, PositionedOccurrence& occurrence) {
    archive(
        cereal::make_nvp("index", occurrence.index),
        cereal::make_nvp("length", occurrence.length),
        cereal::make_nvp("character", occurrence.character),
        cereal::make_nvp("code_point", occurrence.code_point),
        cereal::make_nvp("name", occurrence.name),
        cereal::make_nvp("category", occurrence.category),
        cereal::make_nvp("line", occurrence.line),
        cereal::make_nvp("column", occurrence.column)
    );
}

template <class Archive>
void serialize(Archive& archive, FrequencyEntry& entry) {
    archive(
        cereal::make_nvp("code_point", entry.code_point),
        cereal::make_nvp("name", entry.name),
        cereal::make_nvp("category", entry.category),
        cereal::make_nvp("count", entry.count)
    );
}

template <class Archive>
void serialize(Archive& archive, Visualization& visualization) {
    archive(
        cereal::make_nvp("markup", visualization.markup),
        cereal::make_nvp("count", visualization.count)
    );
}

template <class Archive>
void serialize(Archive& archive, Report& report) {
    archive(
        cereal::make_nvp("occurrences", report.occurrences),
        cereal::make_nvp("frequencies", report.frequencies),
        cereal::make_nvp("visualization", report.visualization)
    );
}

enum class ReportFormat {
    Json,
    Binary
};

void save_report(const Report& report, std::ostream& os, ReportFormat format);
Report load_report(std::istream& is, ReportFormat format);

// Throw std::runtime_error on I/O or archive failure
void save_report(const Report& report, const std::string& path, ReportFormat format);
Report load_report(const std::string& path, ReportFormat format);

} // namespace hc
