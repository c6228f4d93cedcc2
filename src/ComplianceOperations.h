// =====================================================================================
//
//       Filename:  ComplianceOperations.h
//
//    Description:  the analysis operations a user can ask for. each opens the
//                  document, walks its pages and returns a JSON report.
//
//        Version:  1.0
//        Created:  10/19/2026 05:31:26 PM
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

#ifndef _COMPLIANCEOPERATIONS_INC_
#define _COMPLIANCEOPERATIONS_INC_

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ComplianceAnalyzer.h"
#include "PDF_Document.h"

// keys come out in the order they went in so the same document always
// produces the same text.

using OrderedJSON = nlohmann::ordered_json;

// all of these throw DocumentOpenException if the document can't be opened
// and AnalysisException for anything which goes wrong after that. either way
// the document has been closed.

[[nodiscard]] OrderedJSON FindRegulatorySections(const CA::FileName& pdf_path, CA::sv doc_type,
        const DocumentOpener& opener);

[[nodiscard]] OrderedJSON ExtractFinancialStatements(const CA::FileName& pdf_path, const DocumentOpener& opener);

[[nodiscard]] OrderedJSON ValidateFinancialMath(const CA::FileName& pdf_path, const DocumentOpener& opener);

[[nodiscard]] OrderedJSON CheckRequiredSignatures(const CA::FileName& pdf_path, CA::sv doc_type,
        std::optional<double> invoice_amount, const DocumentOpener& opener);

[[nodiscard]] OrderedJSON DetectComplianceRedFlags(const CA::FileName& pdf_path, const DocumentOpener& opener);

[[nodiscard]] OrderedJSON ExtractComparativePeriods(const CA::FileName& pdf_path, const DocumentOpener& opener);

[[nodiscard]] const std::vector<std::string>& OperationNames();

[[nodiscard]] bool OperationNeedsDocType(CA::sv operation);

// request: {"operation": name, "pdf_path": path, "doc_type": type, "invoice_amount": number}
// throws RequestException if it doesn't hold together.

[[nodiscard]] OrderedJSON RunOperation(const nlohmann::json& request, const DocumentOpener& opener);

#endif   /* ----- #ifndef _COMPLIANCEOPERATIONS_INC_  ----- */
