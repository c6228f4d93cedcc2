// =====================================================================================
//
//       Filename:  ComplianceAnalyzerApp.h
//
//    Description:  command line application which runs an analysis operation over
//                  one document or a list of documents.
//
//        Version:  1.0
//        Created:  10/19/2026 06:22:10 PM
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

#ifndef _COMPLIANCEANALYZERAPP_INC_
#define _COMPLIANCEANALYZERAPP_INC_

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "ComplianceAnalyzer.h"
#include "ComplianceOperations.h"
#include "PDF_Document.h"

class ComplianceAnalyzerApp
{
public:
    ComplianceAnalyzerApp(int argc, char *argv[], DocumentOpener opener);

    // use ctor below for testing with predefined options

    ComplianceAnalyzerApp(const std::vector<std::string> &tokens, DocumentOpener opener);

    ComplianceAnalyzerApp() = delete;
    ComplianceAnalyzerApp(const ComplianceAnalyzerApp &rhs) = delete;
    ComplianceAnalyzerApp(ComplianceAnalyzerApp &&rhs) = delete;

    ~ComplianceAnalyzerApp() = default;

    ComplianceAnalyzerApp &operator=(const ComplianceAnalyzerApp &rhs) = delete;
    ComplianceAnalyzerApp &operator=(ComplianceAnalyzerApp &&rhs) = delete;

    static bool SignalReceived()
    {
        return had_signal_;
    }

    bool Startup();

    // success, skipped, errors

    std::tuple<int, int, int> Run();
    void Shutdown();

protected:
    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);

    void ConfigureLogging();

    bool CheckArgs();

    void BuildListOfFilesToProcess();

    [[nodiscard]] nlohmann::json MakeRequest(const CA::FileName &file_name) const;
    [[nodiscard]] fs::path OutputPathFor(const CA::FileName &file_name) const;

    std::tuple<int, int, int> AnalyzeRequest(const nlohmann::json &request, const fs::path &output_path);
    std::tuple<int, int, int> AnalyzeRequestFile();
    std::tuple<int, int, int> AnalyzeSingleFile();
    std::tuple<int, int, int> AnalyzeFilesFromList();
    std::tuple<int, int, int> AnalyzeFilesFromListConcurrently();

    std::tuple<int, int, int> AnalyzeFileAsync(const CA::FileName &file_name);

    void WriteResult(const OrderedJSON &result, const fs::path &output_path) const;

private:
    static void HandleSignal(int signal);

    // ====================  DATA MEMBERS  =======================================

    po::positional_options_description mPositional;       //	old style options
    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    DocumentOpener opener_;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    std::string operation_;
    std::string doc_type_;
    std::string logging_level_{"information"};
    std::string file_list_data_;

    std::optional<double> invoice_amount_;
    double invoice_amount_i_{0.0};

    CA::FileName single_file_to_process_;
    CA::FileName list_of_files_to_process_path_;
    CA::FileName output_directory_;
    CA::FileName request_file_;
    CA::FileName output_file_;
    CA::FileName log_file_path_name_;

    std::vector<CA::sv> list_of_files_to_process_;

    std::shared_ptr<spdlog::logger> logger_;

    int max_at_a_time_{-1}; // how many documents at once in list mode
    int indent_{2};

    static bool had_signal_;

}; // -----  end of class ComplianceAnalyzerApp  -----

#endif /* _COMPLIANCEANALYZERAPP_INC_ */
