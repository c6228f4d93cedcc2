// =====================================================================================
//
//       Filename:  JSON_Document.cpp
//
//    Description:  document whose pages were extracted ahead of time and saved as JSON
//
//        Version:  1.0
//        Created:  10/19/2026 04:16:47 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  Compliance_Analyzer developers
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================


	/* This file is part of Compliance_Analyzer. */

	/* Compliance_Analyzer is free software: you can redistribute it and/or modify */
	/* it under the terms of the GNU General Public License as published by */
	/* the Free Software Foundation, either version 3 of the License, or */
	/* (at your option) any later version. */

	/* Compliance_Analyzer is distributed in the hope that it will be useful, */
	/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
	/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
	/* GNU General Public License for more details. */

	/* You should have received a copy of the GNU General Public License */
	/* along with Compliance_Analyzer.  If not, see <http://www.gnu.org/licenses/>. */

#include "JSON_Document.h"

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"

namespace
{
    // exporters aren't always careful about cell types.

    std::string CellText(const nlohmann::json& cell)
    {
        if (cell.is_string())
        {
            return cell.get<std::string>();
        }
        if (cell.is_null())
        {
            return {};
        }
        return cell.dump();
    }

    CA::Table TableFromJSON(const nlohmann::json& table)
    {
        CA::Table result;
        for (const auto& row : table)
        {
            CA::TableRow cells;
            for (const auto& cell : row)
            {
                cells.push_back(CellText(cell));
            }
            result.push_back(std::move(cells));
        }
        return result;
    }
}

/*
 *--------------------------------------------------------------------------------------
 *       Class:  JSON_Document
 *      Method:  JSON_Document
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
JSON_Document::JSON_Document (const CA::FileName& file_name)
{
    try
    {
        const std::string contents = LoadDataFileForUse(file_name);
        LoadPages(nlohmann::json::parse(contents));
    }
    catch (const DocumentOpenException&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw DocumentOpenException(catenate("Failed to open PDF: ", e.what()));
    }
    spdlog::debug(catenate("Loaded: ", pages_.size(), " pages from: ", file_name.get()));
}  /* -----  end of method JSON_Document::JSON_Document  (constructor)  ----- */

JSON_Document::JSON_Document (const nlohmann::json& document)
{
    try
    {
        LoadPages(document);
    }
    catch (const DocumentOpenException&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw DocumentOpenException(catenate("Failed to open PDF: ", e.what()));
    }
}  /* -----  end of method JSON_Document::JSON_Document  (constructor)  ----- */

void JSON_Document::LoadPages (const nlohmann::json& document)
{
    if (! document.is_object() || ! document.contains("pages") || ! document["pages"].is_array())
    {
        throw DocumentOpenException("Failed to open PDF: document has no 'pages' list.");
    }

    int page_number{0};
    for (const auto& page : document["pages"])
    {
        CA::DocumentPage new_page;
        new_page.page_number_ = ++page_number;
        new_page.text_ = page.value("text", "");

        if (page.contains("tables"))
        {
            for (const auto& table : page["tables"])
            {
                new_page.tables_.push_back(TableFromJSON(table));
            }
        }
        if (page.contains("widgets"))
        {
            for (const auto& widget : page["widgets"])
            {
                new_page.widgets_.push_back(CA::FormWidget{widget.value("field_type", ""),
                    widget.value("field_name", "")});
            }
        }
        pages_.push_back(std::move(new_page));
    }
}		/* -----  end of method JSON_Document::LoadPages  ----- */

int JSON_Document::PageCount () const
{
    return static_cast<int>(pages_.size());
}		/* -----  end of method JSON_Document::PageCount  ----- */

CA::DocumentPage JSON_Document::Page (int index)
{
    if (closed_)
    {
        throw AnalyzerException("Document has been closed.");
    }
    return pages_.at(index);
}		/* -----  end of method JSON_Document::Page  ----- */

void JSON_Document::Close ()
{
    if (! closed_)
    {
        pages_.clear();
        closed_ = true;
    }
}		/* -----  end of method JSON_Document::Close  ----- */
