#include <cassert>
#include <iostream>
#include <sstream>

#include "CsvTable.hpp"

int main()
{
    std::cout << "[Test] Quoted fields, CRLF and BOM..." << std::endl;
    {
        const std::string Text =
            "\xEF\xBB\xBF" "File Path,Note,Size\r\n"
            "/a/b.txt,\"hello, world\",3\r\n"
            "\r\n"
            "\"/a/\"\"q\"\".txt\",\"line1\nline2\",\n";

        CsvTable Table;
        std::string Error;
        assert(Csv::Parse(Text, Table, Error));
        assert(Table.Header.size() == 3);
        assert(Table.Header[0] == "File Path");
        assert(Table.ColumnIndex("Size") == 2);
        assert(Table.ColumnIndex("Missing") == -1);

        assert(Table.Rows.size() == 2);
        assert(Table.Rows[0][1] == "hello, world");
        assert(Table.Rows[1][0] == "/a/\"q\".txt");
        assert(Table.Rows[1][1] == "line1\nline2");
        assert(Table.Rows[1][2].empty());
    }
    std::cout << "[PASS] Quoted fields, CRLF and BOM" << std::endl;

    std::cout << "[Test] Unterminated quote is an error..." << std::endl;
    {
        CsvTable Table;
        std::string Error;
        assert(!Csv::Parse("A,B\n\"open,1\n", Table, Error));
        assert(!Error.empty());
    }
    std::cout << "[PASS] Unterminated quote is an error" << std::endl;

    std::cout << "[Test] Written rows parse back to the same fields..." << std::endl;
    {
        std::ostringstream Stream;
        Csv::WriteRow(Stream, { "Name", "Value" });
        Csv::WriteRow(Stream, { "comma,field", "quote\"field" });
        assert(Csv::EscapeField("plain") == "plain");
        assert(Csv::EscapeField("a,b") == "\"a,b\"");

        CsvTable Table;
        std::string Error;
        assert(Csv::Parse(Stream.str(), Table, Error));
        assert(Table.Rows.size() == 1);
        assert(Table.Rows[0][0] == "comma,field");
        assert(Table.Rows[0][1] == "quote\"field");
    }
    std::cout << "[PASS] Written rows parse back to the same fields" << std::endl;

    std::cout << "[Test] Missing file reports an error..." << std::endl;
    {
        CsvTable Table;
        std::string Error;
        assert(!Csv::ReadFile("/nonexistent/dir/catalog.csv", Table, Error));
        assert(!Error.empty());
    }
    std::cout << "[PASS] Missing file reports an error" << std::endl;

    std::cout << "[PASS] All CsvTable tests passed." << std::endl;
    return 0;
}
