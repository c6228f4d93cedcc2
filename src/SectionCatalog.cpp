// =====================================================================================
//
//       Filename:  SectionCatalog.cpp
//
//    Description:  which sections each type of filing must contain and how to
//                  recognize them.
//
//        Version:  1.0
//        Created:  10/19/2026 11:18:54 AM
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

#include "SectionCatalog.h"

#include <map>

#include <range/v3/algorithm/find_if.hpp>

static const std::vector<std::pair<std::string, DocumentType>> DOCUMENT_TYPE_NAMES
{
    {"10-K", DocumentType::e_10K},
    {"SOX 404", DocumentType::e_SOX404},
    {"8-K", DocumentType::e_8K},
    {"Invoice", DocumentType::e_Invoice}
};

static const std::map<DocumentType, SectionRequirementList> REQUIRED_SECTIONS
{
    {DocumentType::e_10K,
        {
            {"Item 1: Business", false, {"item 1", "business"}},
            {"Item 1A: Risk Factors", true, {"item 1a", "risk factors"}},
            {"Item 7: MD&A", true, {"item 7", "management's discussion", "md&a"}},
            {"Item 8: Financial Statements", true, {"item 8", "financial statements"}},
            {"Item 9A: Controls and Procedures", true, {"item 9a", "controls and procedures"}}
        }
    },
    {DocumentType::e_SOX404,
        {
            {"IT General Controls", true, {"it general controls", "itgc", "it controls"}},
            {"Access Controls", true, {"access controls", "access management"}},
            {"Change Management", false, {"change management", "change controls"}},
            {"Management Assessment", true, {"management assessment", "management certification"}}
        }
    },
    {DocumentType::e_8K,
        {
            {"Item 1.01: Material Agreements", true,
                {"item 1.01", "material definitive agreement", "material agreement"}},
            {"Item 2.01: Acquisition/Disposition", true, {"item 2.01", "acquisition", "disposition of assets"}},
            {"Item 5.02: Officer Changes", false, {"item 5.02", "departure of directors", "officer changes"}},
            {"Item 9.01: Financial Statements/Exhibits", true, {"item 9.01", "financial statements and exhibits"}},
            {"Filing Timeliness", true, {"date of report", "date of earliest event"}}
        }
    },
    {DocumentType::e_Invoice,
        {
            {"Invoice Number", true, {"invoice number", "invoice #", "inv #", "invoice no"}},
            {"Date", true, {"date", "invoice date"}},
            {"Line Items", true, {"description", "line items", "item"}},
            {"Total", true, {"total", "amount due", "balance due"}},
            {"Payment Terms", false, {"payment terms", "due date", "net 30", "net 60"}}
        }
    }
};

std::optional<DocumentType> DocumentTypeFromName(CA::sv doc_type_name)
{
    auto found_it = ranges::find_if(DOCUMENT_TYPE_NAMES, [doc_type_name](const auto& entry)
        { return entry.first == doc_type_name; });
    if (found_it == DOCUMENT_TYPE_NAMES.end())
    {
        return std::nullopt;
    }
    return found_it->second;
}		// -----  end of function DocumentTypeFromName  -----

std::string DocumentTypeName(DocumentType doc_type)
{
    auto found_it = ranges::find_if(DOCUMENT_TYPE_NAMES, [doc_type](const auto& entry)
        { return entry.second == doc_type; });
    return found_it->first;
}		// -----  end of function DocumentTypeName  -----

const SectionRequirementList& RequiredSections(DocumentType doc_type)
{
    return REQUIRED_SECTIONS.at(doc_type);
}		// -----  end of function RequiredSections  -----

const SectionRequirementList& RequiredSections(CA::sv doc_type_name)
{
    static const SectionRequirementList no_requirements;

    auto doc_type = DocumentTypeFromName(doc_type_name);
    if (! doc_type)
    {
        return no_requirements;
    }
    return RequiredSections(doc_type.value());
}		// -----  end of function RequiredSections  -----
