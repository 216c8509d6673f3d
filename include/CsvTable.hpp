#pragma once

#include <ostream>
#include <string>
#include <vector>

struct CsvTable
{
    std::vector<std::string> Header;
    std::vector<std::vector<std::string>> Rows;

    // Index of a header column, or -1.
    int ColumnIndex(const std::string& Name) const;
};

namespace Csv
{
    // RFC 4180: quoted fields may hold separators, doubled quotes and line breaks.
    bool ReadFile(const std::string& FilePath, CsvTable& Out, std::string& Error);
    bool Parse(const std::string& Text, CsvTable& Out, std::string& Error);

    std::string EscapeField(const std::string& Field);
    void WriteRow(std::ostream& Stream, const std::vector<std::string>& Fields);
}
