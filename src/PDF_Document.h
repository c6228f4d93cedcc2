// =====================================================================================
//
//       Filename:  PDF_Document.h
//
//    Description:  what the analysis code needs from a decoded document
//
//        Version:  1.0
//        Created:  10/19/2026 03:49:18 PM
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

#ifndef _PDF_DOCUMENT_INC_
#define _PDF_DOCUMENT_INC_

#include <functional>
#include <memory>

#include "ComplianceAnalyzer.h"

// =====================================================================================
//        Class:  PDF_Document
//  Description:  an opened document. pages are numbered from 1 but requested by
//                0-based index. Close may be called any number of times.
// =====================================================================================

class PDF_Document
{
public:
    // ====================  LIFECYCLE     =======================================

    PDF_Document() = default;
    PDF_Document(const PDF_Document& rhs) = delete;
    PDF_Document(PDF_Document&& rhs) = delete;

    virtual ~PDF_Document() = default;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] virtual int PageCount() const = 0;

    // ====================  MUTATORS      =======================================

    [[nodiscard]] virtual CA::DocumentPage Page(int index) = 0;

    virtual void Close() = 0;

    // ====================  OPERATORS     =======================================

    PDF_Document& operator=(const PDF_Document& rhs) = delete;
    PDF_Document& operator=(PDF_Document&& rhs) = delete;

}; // -----  end of class PDF_Document  -----

// throws DocumentOpenException if the file can't be opened and decoded.

using DocumentOpener = std::function<std::unique_ptr<PDF_Document>(const CA::FileName&)>;

// =====================================================================================
//        Class:  DocumentCloser
//  Description:  closes the document on every way out of a scope.
// =====================================================================================

class DocumentCloser
{
public:
    explicit DocumentCloser(PDF_Document& document) : document_{document} { }
    DocumentCloser(const DocumentCloser& rhs) = delete;
    DocumentCloser& operator=(const DocumentCloser& rhs) = delete;

    ~DocumentCloser() { document_.Close(); }

private:
    PDF_Document& document_;
};

#endif   /* ----- #ifndef _PDF_DOCUMENT_INC_  ----- */
