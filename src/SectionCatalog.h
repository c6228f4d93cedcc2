// =====================================================================================
//
//       Filename:  SectionCatalog.h
//
//    Description:  which sections each type of filing must contain and how to
//                  recognize them.
//
//        Version:  1.0
//        Created:  10/19/2026 11:10:37 AM
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

#ifndef _SECTIONCATALOG_INC_
#define _SECTIONCATALOG_INC_

#include <optional>
#include <string>
#include <vector>

#include "ComplianceAnalyzer.h"

enum class DocumentType
{
    e_10K,
    e_SOX404,
    e_8K,
    e_Invoice
};

struct SectionRequirement
{
    std::string name_;
    bool critical_ = false;
    std::vector<std::string> search_terms_;     // alternatives, first match wins
};

using SectionRequirementList = std::vector<SectionRequirement>;

// names are the ones users give us: '10-K', 'SOX 404', '8-K', 'Invoice'

[[nodiscard]] std::optional<DocumentType> DocumentTypeFromName(CA::sv doc_type_name);

[[nodiscard]] std::string DocumentTypeName(DocumentType doc_type);

[[nodiscard]] const SectionRequirementList& RequiredSections(DocumentType doc_type);

// an unknown name is not an error. it just doesn't require anything.

[[nodiscard]] const SectionRequirementList& RequiredSections(CA::sv doc_type_name);

#endif   /* ----- #ifndef _SECTIONCATALOG_INC_  ----- */
