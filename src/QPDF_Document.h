// =====================================================================================
//
//       Filename:  QPDF_Document.h
//
//    Description:  document read with qpdf. text is recovered from the page content
//                  streams and tables from the tab separated text.
//
//        Version:  1.0
//        Created:  10/19/2026 04:38:02 PM
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

#ifndef _QPDF_DOCUMENT_INC_
#define _QPDF_DOCUMENT_INC_

#include <memory>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFAcroFormDocumentHelper.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "ComplianceAnalyzer.h"
#include "PDF_Document.h"

// kerning adjustments in a TJ array are in thousandths of a text space unit.
// anything more negative than this is treated as a word gap.

constexpr double TJ_WORD_GAP = -200.0;

// how the bytes of a shown string map to characters. composite fonts hold
// glyph ids which we can't map without the font's CMap so their text is dropped.

enum class FontEncoding
{
    e_PDFDoc,
    e_WinAnsi,
    e_MacRoman,
    e_Composite
};

// =====================================================================================
//        Class:  PageTextCollector
//  Description:  content stream callbacks which rebuild a page's text. a move to
//                a new baseline starts a new line, a move along the same baseline
//                is a column gap and becomes a tab. shown strings are decoded
//                to UTF-8 using the encoding of the current font.
// =====================================================================================

class PageTextCollector : public QPDFObjectHandle::ParserCallbacks
{
public:

    // fonts is the page's /Font resource dictionary. anything else means
    // every font is treated as PDFDocEncoding.

    explicit PageTextCollector(QPDFObjectHandle fonts);

    void handleObject(QPDFObjectHandle obj) override;
    void handleEOF() override;

    [[nodiscard]] std::string PageText() const;

private:

    void HandleOperator(const std::string& op);
    void SelectFont(const std::string& font_name);
    void AppendString(const QPDFObjectHandle& obj);
    void NewLine();
    void ColumnGap();

    [[nodiscard]] double NumericOperand(size_t index) const;
    [[nodiscard]] std::string DecodeString(const std::string& bytes) const;

    QPDFObjectHandle fonts_;
    FontEncoding encoding_ = FontEncoding::e_PDFDoc;
    std::vector<QPDFObjectHandle> operands_;
    std::vector<std::string> lines_;
    std::string current_line_;
    double last_y_ = 0.0;
};

// =====================================================================================
//        Class:  QPDF_Document
//  Description:
// =====================================================================================

class QPDF_Document : public PDF_Document
{
public:
    // ====================  LIFECYCLE     =======================================

    explicit QPDF_Document(const CA::FileName& file_name);

    ~QPDF_Document() override;

    // ====================  ACCESSORS     =======================================

    [[nodiscard]] int PageCount() const override;

    // ====================  MUTATORS      =======================================

    [[nodiscard]] CA::DocumentPage Page(int index) override;

    void Close() override;

private:
    // ====================  METHODS       =======================================

    [[nodiscard]] std::string ExtractText(QPDFPageObjectHelper& page);
    [[nodiscard]] CA::FormWidgetList ExtractWidgets(QPDFPageObjectHelper& page);

    // ====================  DATA MEMBERS  =======================================

    CA::FileName file_name_;
    std::unique_ptr<QPDF> pdf_;
    std::unique_ptr<QPDFAcroFormDocumentHelper> acro_form_;
    std::vector<QPDFPageObjectHelper> pages_;

}; // -----  end of class QPDF_Document  -----

// picks the reader from the file extension: '.json' files were extracted
// ahead of time, everything else goes to qpdf.

[[nodiscard]] std::unique_ptr<PDF_Document> OpenDocument(const CA::FileName& file_name);

#endif   /* ----- #ifndef _QPDF_DOCUMENT_INC_  ----- */
