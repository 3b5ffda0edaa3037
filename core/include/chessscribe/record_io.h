/// \file record_io.h
/// \brief JSON and CSV serialization of diagram and grid records.

#pragma once

#include "diagram.h"
#include "grid.h"

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ChessScribe {

/// Column order of the diagram CSV (also the JSON keys).
const std::vector<std::string>& DiagramFieldNames();

/// Column order of the grid CSV.
const std::vector<std::string>& GridSectionFieldNames();

/// Absent fields become null.
nlohmann::json DiagramToJson(const Diagram& diagram);

nlohmann::json GridSectionToJson(const GridSection& section);

/// One CSV row per diagram; absent fields are empty cells.
std::vector<std::string> DiagramToCsvRow(const Diagram& diagram);

/// \param pad_empty_bubbles Writes two placeholder bubbles ("0", "placeholder")
///        for a section without detected bubbles, keeping the column shape uniform.
std::vector<std::string> GridSectionToCsvRow(const GridSection& section, bool pad_empty_bubbles);

/// Quotes one CSV field (always quoted, inner quotes doubled).
std::string QuoteCsvField(const std::string& field);

/// Writes a JSON array of diagrams. Throws IOError.
void WriteDiagramsJson(const std::string& path, const std::vector<Diagram>& diagrams);

/// Writes a UTF-8 (with BOM) CSV of diagrams. Throws IOError.
void WriteDiagramsCsv(const std::string& path, const std::vector<Diagram>& diagrams);

void WriteGridSectionsJson(const std::string& path, const std::vector<GridSection>& sections);

void WriteGridSectionsCsv(const std::string& path, const std::vector<GridSection>& sections,
                          bool pad_empty_bubbles = false);

/// Grid CSV written page by page. The header row is written on construction and
/// every Append is flushed, so rows already written survive an interrupted run.
/// Throws IOError.
class GridCsvWriter {
public:
    GridCsvWriter(const std::string& path, bool pad_empty_bubbles);

    void Append(const std::vector<GridSection>& sections);

    const std::string& path() const { return path_; }
    int rows_written() const { return rows_written_; }

private:
    std::string path_;
    bool pad_empty_bubbles_;
    std::ofstream out_;
    int rows_written_ = 0;
};

} // namespace ChessScribe
