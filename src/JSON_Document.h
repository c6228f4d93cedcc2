// =====================================================================================
//
//       Filename:  JSON_Document.h
//
//    Description:  document whose pages were extracted ahead of time and saved as JSON
//
//        Version:  1.0
//        Created:  10/19/2026 04:05:33 PM
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

#ifndef _JSON_DOCUMENT_INC_
#define _JSON_DOCUMENT_INC_

#include <vector>

#include <nlohmann/json.hpp>

#include "ComplianceAnalyzer.h"
#include "PDF_Document.h"

// expected layout:
//
//  {"pages": [{"text": "...",
//              "tables": [[["cell", ...], ...], ...],
//              "widgets": [{"field_type": "signature", "field_name": "..."}]}]}
//
// 'tables' and 'widgets' may be left out.

// =====================================================================================
//        Class:  JSON_Document
//  Description:
// =====================================================================================

class JSON_Document : public PDF_Document
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit JSON_Document(const CA::FileName& file_name);
    explicit JSON_Document(const nlohmann::json& document);

    ~JSON_Document() override = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] int PageCount() const override;

    // ====================  MUTATORS      =======================================

    [[nodiscard]] CA::DocumentPage Page(int index) override;

    void Close() override;

private:
    // ====================  METHODS       =======================================

    void LoadPages(const nlohmann::json& document);

    // ====================  DATA MEMBERS  =======================================

    std::vector<CA::DocumentPage> pages_;
    bool closed_ = false;

}; // -----  end of class JSON_Document  -----

#endif   /* ----- #ifndef _JSON_DOCUMENT_INC_  ----- */
