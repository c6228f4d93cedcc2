// =====================================================================================
//
//       Filename:  AnalyzerTestData.h
//
//    Description:  in-memory documents and helpers shared by the unit tests
//
//        Version:  1.0
//        Created:  10/19/2026 03:12:40 PM
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

#ifndef _ANALYZERTESTDATA_INC_
#define _ANALYZERTESTDATA_INC_

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ComplianceAnalyzer.h"
#include "JSON_Document.h"
#include "PDF_Document.h"

namespace fs = std::filesystem;

// each call to the opener hands out a fresh copy of the same document.

inline DocumentOpener MakeOpener(const nlohmann::json& document)
{
    return [document](const CA::FileName&) { return std::make_unique<JSON_Document>(document); };
}

inline DocumentOpener FileOpener()
{
    return [](const CA::FileName& file_name) { return std::make_unique<JSON_Document>(file_name); };
}

inline CA::DocumentPage MakePage(int page_number, const std::string& text, CA::TableList tables = {},
        CA::FormWidgetList widgets = {})
{
    return CA::DocumentPage{page_number, text, std::move(tables), std::move(widgets)};
}

inline void WriteTextFile(const fs::path& file_name, const std::string& contents)
{
    std::ofstream output{file_name};
    output << contents;
}

#endif   /* ----- #ifndef _ANALYZERTESTDATA_INC_  ----- */
