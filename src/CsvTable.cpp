#include "CsvTable.hpp"

#include <fstream>
#include <sstream>

int CsvTable::ColumnIndex(const std::string& Name) const
{
    for (size_t i = 0; i < Header.size(); ++i)
    {
        if (Header[i] == Name)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

namespace Csv
{
    bool ReadFile(const std::string& FilePath, CsvTable& Out, std::string& Error)
    {
        std::ifstream File(FilePath, std::ios::binary);
        if (!File.is_open())
        {
            Error = "Failed to open CSV file: " + FilePath;
            return false;
        }

        std::ostringstream Content;
        Content << File.rdbuf();
        if (File.bad())
        {
            Error = "Failed to read CSV file: " + FilePath;
            return false;
        }
        return Parse(Content.str(), Out, Error);
    }

    bool Parse(const std::string& Text, CsvTable& Out, std::string& Error)
    {
        Out.Header.clear();
        Out.Rows.clear();

        size_t Pos = 0;
        if (Text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        {
            Pos = 3;
        }

        std::vector<std::vector<std::string>> Records;
        std::vector<std::string> Fields;
        std::string Field;
        bool InQuotes = false;
        bool FieldStarted = false;

        auto EndRecord = [&]()
        {
            Fields.push_back(std::move(Field));
            Field.clear();
            // A blank line is a single empty field; it is not a record.
            if (!(Fields.size() == 1 && Fields[0].empty() && !FieldStarted))
            {
                Records.push_back(std::move(Fields));
            }
            Fields.clear();
            FieldStarted = false;
        };

        for (; Pos < Text.size(); ++Pos)
        {
            char Ch = Text[Pos];
            if (InQuotes)
            {
                if (Ch == '"')
                {
                    if (Pos + 1 < Text.size() && Text[Pos + 1] == '"')
                    {
                        Field += '"';
                        ++Pos;
                    }
                    else
                    {
                        InQuotes = false;
                    }
                }
                else
                {
                    Field += Ch;
                }
                continue;
            }

            switch (Ch)
            {
            case '"':
                InQuotes = true;
                FieldStarted = true;
                break;
            case ',':
                Fields.push_back(std::move(Field));
                Field.clear();
                FieldStarted = true;
                break;
            case '\r':
                if (Pos + 1 < Text.size() && Text[Pos + 1] == '\n')
                {
                    ++Pos;
                }
                EndRecord();
                break;
            case '\n':
                EndRecord();
                break;
            default:
                Field += Ch;
                FieldStarted = true;
                break;
            }
        }

        if (InQuotes)
        {
            Error = "Unterminated quoted field in CSV input.";
            return false;
        }
        if (FieldStarted || !Field.empty() || !Fields.empty())
        {
            EndRecord();
        }

        if (Records.empty())
        {
            return true;
        }

        Out.Header = std::move(Records.front());
        for (size_t i = 1; i < Records.size(); ++i)
        {
            Out.Rows.push_back(std::move(Records[i]));
        }
        return true;
    }

    std::string EscapeField(const std::string& Field)
    {
        if (Field.find_first_of(",\"\r\n") == std::string::npos)
        {
            return Field;
        }

        std::string Escaped = "\"";
        for (char Ch : Field)
        {
            if (Ch == '"')
            {
                Escaped += '"';
            }
            Escaped += Ch;
        }
        Escaped += '"';
        return Escaped;
    }

    void WriteRow(std::ostream& Stream, const std::vector<std::string>& Fields)
    {
        for (size_t i = 0; i < Fields.size(); ++i)
        {
            if (i > 0)
            {
                Stream << ',';
            }
            Stream << EscapeField(Fields[i]);
        }
        Stream << "\r\n";
    }
}
