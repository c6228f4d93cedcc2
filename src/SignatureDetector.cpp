// =====================================================================================
//
//       Filename:  SignatureDetector.cpp
//
//    Description:  find signature fields and signer mentions and decide whether a
//                  document carries the signatures its type requires.
//
//        Version:  1.0
//        Created:  10/19/2026 02:51:30 PM
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

#include "SignatureDetector.h"

#include <array>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/copy_if.hpp>
#include <range/v3/algorithm/transform.hpp>
#include <range/v3/iterator/insert_iterators.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "SectionCatalog.h"
#include "TermLocator.h"

// phrase -> role. checked in this order on every page.

static const std::array<std::pair<CA::sv, CA::sv>, 8> SIGNATURE_PHRASES
{{
    {"CFO", "CFO"},
    {"CEO", "CEO"},
    {"Chief Financial Officer", "CFO"},
    {"Chief Executive Officer", "CEO"},
    {"Chief Accounting Officer", "CAO"},
    {"signed by", "Authorized Signer"},
    {"approved by", "Approver"},
    {"certified by", "Certifier"}
}};

static const CA::sv SIGNATURE_FIELD_TYPE = "signature";

std::string SignatureKindName(SignatureKind kind)
{
    return kind == SignatureKind::e_Digital ? "digital_signature" : "text_mention";
}		// -----  end of function SignatureKindName  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SignatureDetector
 *      Method:  SignatureDetector::operator()
 * Description:
 *--------------------------------------------------------------------------------------
 */
void SignatureDetector::operator() (const CA::DocumentPage& page)
{
    for (const auto& widget : page.widgets_)
    {
        if (widget.field_type_ != SIGNATURE_FIELD_TYPE)
        {
            continue;
        }
        spdlog::debug(catenate("Signature field: '", widget.field_name_, "' on page: ", page.page_number_));

        AddFinding(SignatureFinding{SignatureKind::e_Digital,
            widget.field_name_.empty() ? "Unknown" : widget.field_name_, page.page_number_,
            catenate("Digital signature field: ", widget.field_name_)});
    }

    const std::string lowered_text = ToLower(page.text_);

    for (const auto& [phrase, role] : SIGNATURE_PHRASES)
    {
        auto pos = FindTerm(lowered_text, phrase);
        if (! pos)
        {
            continue;
        }
        if (roles_seen_.contains({std::string{role}, page.page_number_}))
        {
            continue;
        }
        AddFinding(SignatureFinding{SignatureKind::e_Textual, std::string{role}, page.page_number_,
            ExtractExcerpt(page.text_, pos.value(), SIGNATURE_EXCERPT_BEFORE, SIGNATURE_EXCERPT_AFTER)});
    }
}		/* -----  end of method SignatureDetector::operator()  ----- */

void SignatureDetector::AddFinding (SignatureFinding finding)
{
    roles_seen_.emplace(finding.role_, finding.page_);
    findings_.push_back(std::move(finding));
}		/* -----  end of method SignatureDetector::AddFinding  ----- */

std::vector<std::string> SignatureDetector::FoundRoles () const
{
    std::vector<std::string> roles;
    ranges::transform(findings_, ranges::back_inserter(roles), &SignatureFinding::role_);
    return roles;
}		/* -----  end of method SignatureDetector::FoundRoles  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  RequiredSignatures
 *  Description:
 * =====================================================================================
 */
std::vector<std::string> RequiredSignatures(CA::sv doc_type_name, std::optional<double> invoice_amount)
{
    auto doc_type = DocumentTypeFromName(doc_type_name);
    if (! doc_type)
    {
        return {};
    }

    switch (doc_type.value())
    {
        case DocumentType::e_SOX404:
            return {"CFO Certification", "CEO Certification"};
        case DocumentType::e_10K:
            return {"CEO Signature", "CFO Signature", "CAO Signature"};
        case DocumentType::e_8K:
            return {"Authorized Signer"};
        case DocumentType::e_Invoice:
            if (invoice_amount && invoice_amount.value() > INVOICE_APPROVAL_THRESHOLD)
            {
                return {"Authorized Approver"};
            }
            break;
    }
    return {};
}		// -----  end of function RequiredSignatures  -----

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  SignatureRequirementSatisfied
 *  Description:
 * =====================================================================================
 */
bool SignatureRequirementSatisfied(CA::sv required, const std::vector<std::string>& found_roles)
{
    const std::string upper_required = boost::algorithm::to_upper_copy(std::string{required});

    std::vector<std::string> words;
    boost::algorithm::split(words, upper_required, boost::algorithm::is_space(),
            boost::algorithm::token_compress_on);

    std::vector<std::string> keywords;
    ranges::copy_if(words, ranges::back_inserter(keywords), [](const auto& word) { return ! word.empty(); });

    return ranges::any_of(found_roles, [&keywords](const auto& role)
        {
            const std::string upper_role = boost::algorithm::to_upper_copy(role);
            return ranges::any_of(keywords, [&upper_role](const auto& keyword)
                { return upper_role.find(keyword) != std::string::npos; });
        });
}		// -----  end of function SignatureRequirementSatisfied  -----

std::vector<std::string> MissingSignatures(const std::vector<std::string>& required,
        const std::vector<std::string>& found_roles)
{
    std::vector<std::string> missing;
    ranges::copy_if(required, ranges::back_inserter(missing), [&found_roles](const auto& signature)
        { return ! SignatureRequirementSatisfied(signature, found_roles); });
    return missing;
}		// -----  end of function MissingSignatures  -----
