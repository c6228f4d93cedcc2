// =====================================================================================
//
//       Filename:  ComplianceAnalyzer_main.cpp
//
//    Description:  run a compliance analysis over PDF documents from the command line
//
//        Version:  1.0
//        Created:  10/19/2026 07:34:18 PM
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

#include <iostream>

#include "spdlog/spdlog.h"

#include "ComplianceAnalyzerApp.h"
#include "QPDF_Document.h"

int main(int argc, char* argv[])
{
    auto result{0};

    ComplianceAnalyzerApp analyzer(argc, argv, OpenDocument);

    try
    {
        if (! analyzer.Startup())
        {
            return 1;
        }

        [[maybe_unused]] auto [success_counter, skipped_counter, error_counter] = analyzer.Run();
        if (error_counter > 0)
        {
            result = 1;
        }

        analyzer.Shutdown();
    }
    catch (std::exception& e)
    {
        const OrderedJSON error{{"error", e.what()}};
        std::cout << error.dump(-1, ' ', false, OrderedJSON::error_handler_t::replace) << '\n';
        spdlog::error(e.what());
        analyzer.Shutdown();
        result = 1;
    }

    return result;
}        // -----  end of method main  -----
