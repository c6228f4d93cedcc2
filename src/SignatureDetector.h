// =====================================================================================
//
//       Filename:  SignatureDetector.h
//
//    Description:  find signature fields and signer mentions and decide whether a
//                  document carries the signatures its type requires.
//
//        Version:  1.0
//        Created:  10/19/2026 02:36:09 PM
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

#ifndef _SIGNATUREDETECTOR_INC_
#define _SIGNATUREDETECTOR_INC_

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ComplianceAnalyzer.h"

constexpr size_t SIGNATURE_EXCERPT_BEFORE = 50;
constexpr size_t SIGNATURE_EXCERPT_AFTER = 100;

constexpr double INVOICE_APPROVAL_THRESHOLD = 10'000.0;

enum class SignatureKind
{
    e_Digital,
    e_Textual
};

[[nodiscard]] std::string SignatureKindName(SignatureKind kind);

struct SignatureFinding
{
    SignatureKind kind_ = SignatureKind::e_Textual;
    std::string role_;
    int page_ = 0;
    std::string excerpt_;
};

using SignatureFindingList = std::vector<SignatureFinding>;

// =====================================================================================
//        Class:  SignatureDetector
//  Description:  feed it pages in order. on each page, signature form fields are
//                recorded first. a text mention is dropped if its role has already
//                been found on the same page.
// =====================================================================================

class SignatureDetector
{
public:

    SignatureDetector() = default;

    void operator()(const CA::DocumentPage& page);

    [[nodiscard]] const SignatureFindingList& Findings() const { return findings_; }

    [[nodiscard]] std::vector<std::string> FoundRoles() const;

private:

    void AddFinding(SignatureFinding finding);

    SignatureFindingList findings_;
    std::set<std::pair<std::string, int>> roles_seen_;
};

// unknown document types don't require anything. an invoice needs an approver
// only when its amount is above the threshold.

[[nodiscard]] std::vector<std::string> RequiredSignatures(CA::sv doc_type_name,
        std::optional<double> invoice_amount);

// satisfied if any word of the requirement (upper cased) appears inside any
// found role (upper cased). 'CEO Signature' is satisfied by 'CEO'.

[[nodiscard]] bool SignatureRequirementSatisfied(CA::sv required, const std::vector<std::string>& found_roles);

[[nodiscard]] std::vector<std::string> MissingSignatures(const std::vector<std::string>& required,
        const std::vector<std::string>& found_roles);

#endif   /* ----- #ifndef _SIGNATUREDETECTOR_INC_  ----- */
