// =====================================================================================
//
//       Filename:  QPDF_Document.cpp
//
//    Description:  document read with qpdf. text is recovered from the page content
//                  streams and tables from the tab separated text.
//
//        Version:  1.0
//        Created:  10/19/2026 04:59:41 PM
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

#include "QPDF_Document.h"

#include <cmath>
#include <map>

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QUtil.hh>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "spdlog/spdlog.h"

#include "Analyzer_Utils.h"
#include "JSON_Document.h"
#include "TablesFromText.h"

// how far the baseline must move before we call it a new line.

constexpr double BASELINE_EPSILON = 0.5;

// simple font /Encoding (or its /BaseEncoding) names we know how to decode.
// anything else is close enough to PDFDocEncoding for the ASCII range.

static const std::map<std::string, FontEncoding> SIMPLE_FONT_ENCODINGS
{
    {"/WinAnsiEncoding", FontEncoding::e_WinAnsi},
    {"/MacRomanEncoding", FontEncoding::e_MacRoman},
    {"/PDFDocEncoding", FontEncoding::e_PDFDoc},
    {"/StandardEncoding", FontEncoding::e_PDFDoc}
};

PageTextCollector::PageTextCollector (QPDFObjectHandle fonts)
    : fonts_{std::move(fonts)}
{
}  /* -----  end of method PageTextCollector::PageTextCollector  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  PageTextCollector
 *      Method:  PageTextCollector::handleObject
 * Description:  operands pile up until their operator arrives.
 *--------------------------------------------------------------------------------------
 */
void PageTextCollector::handleObject (QPDFObjectHandle obj)
{
    if (obj.isOperator())
    {
        HandleOperator(obj.getOperatorValue());
        operands_.clear();
        return;
    }
    operands_.push_back(obj);
}		/* -----  end of method PageTextCollector::handleObject  ----- */

void PageTextCollector::handleEOF ()
{
    NewLine();
}		/* -----  end of method PageTextCollector::handleEOF  ----- */

void PageTextCollector::HandleOperator (const std::string& op)
{
    if (op == "Tf")
    {
        if (! operands_.empty() && operands_.front().isName())
        {
            SelectFont(operands_.front().getName());
        }
    }
    else if (op == "Tj")
    {
        if (! operands_.empty())
        {
            AppendString(operands_.back());
        }
    }
    else if (op == "TJ")
    {
        if (operands_.empty() || ! operands_.back().isArray())
        {
            return;
        }
        for (const auto& item : operands_.back().getArrayAsVector())
        {
            if (item.isNumber())
            {
                if (item.getNumericValue() < TJ_WORD_GAP)
                {
                    current_line_ += ' ';
                }
                continue;
            }
            AppendString(item);
        }
    }
    else if (op == "'" || op == "\"")
    {
        NewLine();
        if (! operands_.empty())
        {
            AppendString(operands_.back());
        }
    }
    else if (op == "Td" || op == "TD")
    {
        if (operands_.size() < 2)
        {
            return;
        }
        if (std::abs(NumericOperand(1)) > BASELINE_EPSILON)
        {
            NewLine();
        }
        else if (std::abs(NumericOperand(0)) > BASELINE_EPSILON)
        {
            ColumnGap();
        }
    }
    else if (op == "Tm")
    {
        if (operands_.size() < 6)
        {
            return;
        }
        const double new_y = NumericOperand(5);
        if (std::abs(new_y - last_y_) > BASELINE_EPSILON)
        {
            NewLine();
        }
        else
        {
            ColumnGap();
        }
        last_y_ = new_y;
    }
    else if (op == "T*" || op == "ET")
    {
        NewLine();
    }
}		/* -----  end of method PageTextCollector::HandleOperator  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  PageTextCollector
 *      Method:  PageTextCollector::SelectFont
 * Description:  a font missing from the resources keeps the PDFDocEncoding default.
 *--------------------------------------------------------------------------------------
 */
void PageTextCollector::SelectFont (const std::string& font_name)
{
    encoding_ = FontEncoding::e_PDFDoc;

    if (! fonts_.isDictionary() || ! fonts_.hasKey(font_name))
    {
        spdlog::debug(catenate("Font: ", font_name, " not in page resources."));
        return;
    }
    auto font = fonts_.getKey(font_name);
    if (! font.isDictionary())
    {
        return;
    }

    auto subtype = font.getKey("/Subtype");
    if (subtype.isName() && subtype.getName() == "/Type0")
    {
        spdlog::debug(catenate("Font: ", font_name, " is a composite font. Its text is skipped."));
        encoding_ = FontEncoding::e_Composite;
        return;
    }

    auto encoding = font.getKey("/Encoding");
    if (encoding.isDictionary())
    {
        encoding = encoding.getKey("/BaseEncoding");
    }
    if (! encoding.isName())
    {
        return;
    }
    if (auto found = SIMPLE_FONT_ENCODINGS.find(encoding.getName()); found != SIMPLE_FONT_ENCODINGS.end())
    {
        encoding_ = found->second;
    }
}		/* -----  end of method PageTextCollector::SelectFont  ----- */

void PageTextCollector::AppendString (const QPDFObjectHandle& obj)
{
    if (obj.isString())
    {
        current_line_ += DecodeString(obj.getStringValue());
    }
}		/* -----  end of method PageTextCollector::AppendString  ----- */

std::string PageTextCollector::DecodeString (const std::string& bytes) const
{
    switch (encoding_)
    {
        case FontEncoding::e_WinAnsi:
            return QUtil::win_ansi_to_utf8(bytes);
        case FontEncoding::e_MacRoman:
            return QUtil::mac_roman_to_utf8(bytes);
        case FontEncoding::e_Composite:
            return {};
        case FontEncoding::e_PDFDoc:
            break;
    }
    return QUtil::pdf_doc_to_utf8(bytes);
}		/* -----  end of method PageTextCollector::DecodeString  ----- */

void PageTextCollector::NewLine ()
{
    if (! current_line_.empty())
    {
        lines_.push_back(std::move(current_line_));
        current_line_.clear();
    }
}		/* -----  end of method PageTextCollector::NewLine  ----- */

void PageTextCollector::ColumnGap ()
{
    if (! current_line_.empty() && current_line_.back() != '\t')
    {
        current_line_ += '\t';
    }
}		/* -----  end of method PageTextCollector::ColumnGap  ----- */

double PageTextCollector::NumericOperand (size_t index) const
{
    const auto& operand = operands_.at(index);
    return operand.isNumber() ? operand.getNumericValue() : 0.0;
}		/* -----  end of method PageTextCollector::NumericOperand  ----- */

std::string PageTextCollector::PageText () const
{
    std::string text = boost::algorithm::join(lines_, "\n");
    if (! current_line_.empty())
    {
        if (! text.empty())
        {
            text += '\n';
        }
        text += current_line_;
    }
    return text;
}		/* -----  end of method PageTextCollector::PageText  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QPDF_Document
 *      Method:  QPDF_Document
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
QPDF_Document::QPDF_Document (const CA::FileName& file_name)
    : file_name_{file_name}
{
    try
    {
        pdf_ = std::make_unique<QPDF>();
        pdf_->processFile(file_name_.get().c_str());
        acro_form_ = std::make_unique<QPDFAcroFormDocumentHelper>(*pdf_);
        pages_ = QPDFPageDocumentHelper(*pdf_).getAllPages();
    }
    catch (const std::exception& e)
    {
        throw DocumentOpenException(catenate("Failed to open PDF: ", e.what()));
    }
    spdlog::debug(catenate("Opened: ", file_name_.get(), " with: ", pages_.size(), " pages."));
}  /* -----  end of method QPDF_Document::QPDF_Document  (constructor)  ----- */

QPDF_Document::~QPDF_Document ()
{
    Close();
}		/* -----  end of method QPDF_Document::~QPDF_Document  ----- */

int QPDF_Document::PageCount () const
{
    return static_cast<int>(pages_.size());
}		/* -----  end of method QPDF_Document::PageCount  ----- */

CA::DocumentPage QPDF_Document::Page (int index)
{
    if (! pdf_)
    {
        throw AnalyzerException(catenate("Document: ", file_name_.get(), " has been closed."));
    }
    auto& page = pages_.at(index);

    CA::DocumentPage result;
    result.page_number_ = index + 1;
    result.text_ = ExtractText(page);
    result.tables_ = CollectTablesFromText(result.text_);
    result.widgets_ = ExtractWidgets(page);
    return result;
}		/* -----  end of method QPDF_Document::Page  ----- */

void QPDF_Document::Close ()
{
    pages_.clear();
    acro_form_.reset();
    pdf_.reset();
}		/* -----  end of method QPDF_Document::Close  ----- */

std::string QPDF_Document::ExtractText (QPDFPageObjectHelper& page)
{
    // resources can be inherited from the page tree.

    auto resources = page.getAttribute("/Resources", false);
    PageTextCollector collector{resources.isDictionary() ? resources.getKey("/Font") : QPDFObjectHandle::newNull()};
    page.parseContents(&collector);
    return collector.PageText();
}		/* -----  end of method QPDF_Document::ExtractText  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  QPDF_Document
 *      Method:  QPDF_Document::ExtractWidgets
 * Description:  only signature fields are of interest.
 *--------------------------------------------------------------------------------------
 */
CA::FormWidgetList QPDF_Document::ExtractWidgets (QPDFPageObjectHelper& page)
{
    CA::FormWidgetList widgets;

    if (! acro_form_->hasAcroForm())
    {
        return widgets;
    }

    for (auto& annotation : acro_form_->getWidgetAnnotationsForPage(page))
    {
        auto field = acro_form_->getFieldForAnnotation(annotation);
        if (field.getFieldType() == "/Sig")
        {
            widgets.push_back(CA::FormWidget{"signature", field.getFullyQualifiedName()});
        }
    }
    return widgets;
}		/* -----  end of method QPDF_Document::ExtractWidgets  ----- */

/*
 * ===  FUNCTION  ======================================================================
 *         Name:  OpenDocument
 *  Description:
 * =====================================================================================
 */
std::unique_ptr<PDF_Document> OpenDocument(const CA::FileName& file_name)
{
    if (boost::algorithm::iequals(file_name.get().extension().string(), ".json"))
    {
        return std::make_unique<JSON_Document>(file_name);
    }
    return std::make_unique<QPDF_Document>(file_name);
}		/* -----  end of function OpenDocument  ----- */
