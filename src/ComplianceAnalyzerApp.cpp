// =====================================================================================
//
//       Filename:  ComplianceAnalyzerApp.cpp
//
//    Description:  command line application which runs an analysis operation over
//                  one document or a list of documents.
//
//        Version:  1.0
//        Created:  10/19/2026 06:40:57 PM
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

#include "ComplianceAnalyzerApp.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <exception>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <system_error>
#include <thread>

#include <boost/assert.hpp>

#include <range/v3/action/remove_if.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/for_each.hpp>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "Analyzer_Utils.h"
#include "SectionCatalog.h"

using namespace std::string_literals;

bool ComplianceAnalyzerApp::had_signal_ = false;

// code from "The C++ Programming Language" 4th Edition. p. 1243.
// with modifications.
//
// return index of ready future
// if no future is ready, wait for d before trying again

template<typename T>
int wait_for_any(std::vector<std::future<T>>& vf, int continue_here, std::chrono::steady_clock::duration d)
{
    while(true)
    {
        for (int i=continue_here; i!=static_cast<int>(vf.size()); ++i)
        {
            if (!vf[i].valid())
            {
                continue;
            }
            switch (vf[i].wait_for(std::chrono::seconds{0}))
            {
            case std::future_status::ready:
                    return i;

            case std::future_status::timeout:
                break;

            case std::future_status::deferred:
                throw std::runtime_error("wait_for_all(): deferred future");
            }
        }
        continue_here = 0;

        if (ComplianceAnalyzerApp::SignalReceived())
        {
            break;
        }

        std::this_thread::sleep_for(d);
    }

    return -1;
}

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ComplianceAnalyzerApp
 *      Method:  ComplianceAnalyzerApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ComplianceAnalyzerApp::ComplianceAnalyzerApp (int argc, char* argv[], DocumentOpener opener)
    : opener_{std::move(opener)}, mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method ComplianceAnalyzerApp::ComplianceAnalyzerApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ComplianceAnalyzerApp
 *      Method:  ComplianceAnalyzerApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ComplianceAnalyzerApp::ComplianceAnalyzerApp (const std::vector<std::string>& tokens, DocumentOpener opener)
    : opener_{std::move(opener)}, tokens_{tokens}
{
}  /* -----  end of method ComplianceAnalyzerApp::ComplianceAnalyzerApp  (constructor)  ----- */

void ComplianceAnalyzerApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().c_str());
            spdlog::set_default_logger(logger_);
        }
    }
    else
    {
        // results go to stdout so keep the log out of their way.

        logger_ = spdlog::get("ComplianceAnalyzer_logger");
        if (! logger_)
        {
            logger_ = spdlog::stderr_color_mt("ComplianceAnalyzer_logger");
        }
        spdlog::set_default_logger(logger_);
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }
}		/* -----  end of method ComplianceAnalyzerApp::ConfigureLogging  ----- */

bool ComplianceAnalyzerApp::Startup()
{
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ConfigureLogging();
        spdlog::info(catenate("\n\n*** Begin run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method ComplianceAnalyzerApp::Startup  ----- */

void ComplianceAnalyzerApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("operation,o", po::value<std::string>(&operation_),
         "analysis to run. One of: 'find_regulatory_sections', 'extract_financial_statements', "
         "'validate_financial_math', 'check_required_signatures', 'detect_compliance_red_flags', "
         "'extract_comparative_periods'.")
		("file,f", po::value<CA::FileName>(&single_file_to_process_), "single document to be analyzed.")
		("list-file", po::value<CA::FileName>(&list_of_files_to_process_path_),
         "path to file with list of documents to analyze.")
		("output-dir", po::value<CA::FileName>(&output_directory_),
         "directory to write one result file per document to when using 'list-file'.")
		("concurrent,k", po::value<int>(&max_at_a_time_)->default_value(-1),
         "Maximum number of documents analyzed at a time. Default of -1 means one after the other.")
		("doc-type,t", po::value<std::string>(&doc_type_),
         "document type. Must be '10-K|SOX 404|8-K|Invoice'. Needed for sections and signatures.")
		("invoice-amount", po::value<double>(&invoice_amount_i_), "invoice amount used for signature requirements.")
		("request-file", po::value<CA::FileName>(&request_file_),
         "path to JSON request naming 'operation', 'pdf_path' and any parameters.")
		("output", po::value<CA::FileName>(&output_file_), "write result here instead of to stdout.")
		("indent", po::value<int>(&indent_)->default_value(2), "JSON indentation. Default is 2.")
		("log-level,l", po::value<std::string>(&logging_level_),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<CA::FileName>(&log_file_path_name_),	"path name for log file.")
		;
}		/* -----  end of method ComplianceAnalyzerApp::SetupProgramOptions  ----- */

void ComplianceAnalyzerApp::ParseProgramOptions ()
{
	auto options = po::parse_command_line(mArgc, mArgv, *mNewOptions);
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);
}		/* -----  end of method ComplianceAnalyzerApp::ParseProgramOptions  ----- */

void ComplianceAnalyzerApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
	po::notify(mVariableMap);
}		/* -----  end of method ComplianceAnalyzerApp::ParseProgramOptions  ----- */

bool ComplianceAnalyzerApp::CheckArgs ()
{
    BOOST_ASSERT_MSG(logging_level_ == "none" || logging_level_ == "error" || logging_level_ == "information"
            || logging_level_ == "debug", "log-level must be: 'none|error|information|debug'.");

    BOOST_ASSERT_MSG(indent_ >= -1, "indent must be -1 (compact) or more.");

    if (mVariableMap.count("invoice-amount") == 1)
    {
        invoice_amount_ = invoice_amount_i_;
    }

    // a request file carries everything else we need.

    if (! request_file_.get().empty())
    {
        BOOST_ASSERT_MSG(fs::exists(request_file_.get()), catenate("Can't find request file: ", request_file_.get()).c_str());
        BOOST_ASSERT_MSG(fs::is_regular_file(request_file_.get()), catenate("Path: ", request_file_.get(),
                    " is not a regular file.").c_str());
        return true;
    }

    BOOST_ASSERT_MSG(! operation_.empty(), "Must specify an operation.");
    BOOST_ASSERT_MSG(ranges::find(OperationNames(), operation_) != OperationNames().end(),
            catenate("Unknown operation: ", operation_).c_str());

    if (OperationNeedsDocType(operation_))
    {
        BOOST_ASSERT_MSG(! doc_type_.empty(), catenate("Operation: ", operation_, " needs a doc-type.").c_str());
        if (! DocumentTypeFromName(doc_type_))
        {
            spdlog::info(catenate("Document type: '", doc_type_, "' has no requirements."));
        }
    }

    if (! single_file_to_process_.get().empty())
    {
        BOOST_ASSERT_MSG(fs::exists(single_file_to_process_.get()), catenate("Can't find file: ",
                    single_file_to_process_.get()).c_str());
        BOOST_ASSERT_MSG(fs::is_regular_file(single_file_to_process_.get()), catenate("Path: ",
                    single_file_to_process_.get(), " is not a regular file.").c_str());
    }

    auto list_of_files_to_process_path_val = list_of_files_to_process_path_.get();
    if (! list_of_files_to_process_path_val.empty())
    {
        BOOST_ASSERT_MSG(fs::exists(list_of_files_to_process_path_val),
                catenate("Can't find file: ", list_of_files_to_process_path_val).c_str());
        BOOST_ASSERT_MSG(fs::is_regular_file(list_of_files_to_process_path_val),
                catenate("Path: ", list_of_files_to_process_path_val, " is not a regular file.").c_str());
        BOOST_ASSERT_MSG(! output_directory_.get().empty(), "Must specify output-dir when using list-file.");

        if (! fs::exists(output_directory_.get()))
        {
            fs::create_directories(output_directory_.get());
        }
        BuildListOfFilesToProcess();
    }

    BOOST_ASSERT_MSG(NotAllEmpty(single_file_to_process_.get(), list_of_files_to_process_),
            "No documents to analyze found.");

    return true;
}       // -----  end of method ComplianceAnalyzerApp::CheckArgs  -----

void ComplianceAnalyzerApp::BuildListOfFilesToProcess()
{
    list_of_files_to_process_.clear();      //  in case of reprocessing.

    file_list_data_ = LoadDataFileForUse(list_of_files_to_process_path_);

    list_of_files_to_process_ = split_string<CA::sv>(file_list_data_, '\n');
    list_of_files_to_process_ |= ranges::actions::remove_if([](CA::sv file_name) { return Trim(file_name).empty(); });

    spdlog::info(catenate("Found: ", list_of_files_to_process_.size(), " files in list."));
}		/* -----  end of method ComplianceAnalyzerApp::BuildListOfFilesToProcess  ----- */

nlohmann::json ComplianceAnalyzerApp::MakeRequest (const CA::FileName& file_name) const
{
    nlohmann::json request;
    request["operation"] = operation_;
    request["pdf_path"] = file_name.get().string();
    if (! doc_type_.empty())
    {
        request["doc_type"] = doc_type_;
    }
    if (invoice_amount_)
    {
        request["invoice_amount"] = invoice_amount_.value();
    }
    return request;
}		/* -----  end of method ComplianceAnalyzerApp::MakeRequest  ----- */

fs::path ComplianceAnalyzerApp::OutputPathFor (const CA::FileName& file_name) const
{
    return output_directory_.get() / catenate(file_name.get().stem().string(), '_', operation_, ".json");
}		/* -----  end of method ComplianceAnalyzerApp::OutputPathFor  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ComplianceAnalyzerApp
 *      Method:  ComplianceAnalyzerApp::Run
 * Description:
 *--------------------------------------------------------------------------------------
 */
std::tuple<int, int, int> ComplianceAnalyzerApp::Run()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    if (! request_file_.get().empty())
    {
        counters = AddTs(counters, AnalyzeRequestFile());
    }
    else
    {
        if (! single_file_to_process_.get().empty())
        {
            counters = AddTs(counters, AnalyzeSingleFile());
        }

        if (! list_of_files_to_process_.empty())
        {
            if (max_at_a_time_ < 1)
            {
                counters = AddTs(counters, AnalyzeFilesFromList());
            }
            else
            {
                counters = AddTs(counters, AnalyzeFilesFromListConcurrently());
            }
        }
    }

    auto [success_counter, skipped_counter, error_counter] = counters;

    spdlog::info(catenate("Analyzed: ", SumT(counters), " documents. Successes: ",
            success_counter, ". Skips: ", skipped_counter , ". Errors: ", error_counter, "."));

    return counters;
}		/* -----  end of method ComplianceAnalyzerApp::Run  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ComplianceAnalyzerApp
 *      Method:  ComplianceAnalyzerApp::AnalyzeRequest
 * Description:  a failed analysis still produces output: an object holding
 *               just the error message.
 *--------------------------------------------------------------------------------------
 */
std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeRequest (const nlohmann::json& request,
        const fs::path& output_path)
{
    try
    {
        auto result = RunOperation(request, opener_);
        WriteResult(result, output_path);
        return {1, 0, 0};
    }
    catch (const std::system_error& e)
    {
        spdlog::error(catenate("System error while analyzing: ", request.value("pdf_path", ""), ". ", e.what()));
        throw;
    }
    catch (const std::exception& e)
    {
        spdlog::error(e.what());
        WriteResult(OrderedJSON{{"error", e.what()}}, output_path);
    }
    return {0, 0, 1};
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeRequest  ----- */

std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeRequestFile ()
{
    nlohmann::json request;
    try
    {
        request = nlohmann::json::parse(LoadDataFileForUse(request_file_));
    }
    catch (const std::exception& e)
    {
        const std::string message = catenate("Unable to read request: ", request_file_.get(), ". ", e.what());
        spdlog::error(message);
        WriteResult(OrderedJSON{{"error", message}}, output_file_.get());
        return {0, 0, 1};
    }
    return AnalyzeRequest(request, output_file_.get());
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeRequestFile  ----- */

std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeSingleFile ()
{
    spdlog::info(catenate("Analyzing file: ", single_file_to_process_.get()));
    return AnalyzeRequest(MakeRequest(single_file_to_process_), output_file_.get());
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeSingleFile  ----- */

std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeFileAsync (const CA::FileName& file_name)
{
    if (! fs::is_regular_file(file_name.get()))
    {
        spdlog::info(catenate("Skipping: ", file_name.get(), ". Not a regular file."));
        return {0, 1, 0};
    }

    spdlog::info(catenate("Analyzing file: ", file_name.get()));
    return AnalyzeRequest(MakeRequest(file_name), OutputPathFor(file_name));
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeFileAsync  ----- */

std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeFilesFromList ()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    ranges::for_each(list_of_files_to_process_, [this, &counters](CA::sv file_name)
        {
            counters = AddTs(counters, AnalyzeFileAsync(CA::FileName{Trim(file_name)}));
        });

    return counters;
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeFilesFromList  ----- */

std::tuple<int, int, int> ComplianceAnalyzerApp::AnalyzeFilesFromListConcurrently ()
{
    // a long list can take a while. give the user a way to stop cleanly.
    // (taken from "Advanced Unix Programming" by Warren W. Gay, p. 317)

    struct sigaction sa_old;
    struct sigaction sa_new;

    // ok, get ready to handle keyboard interrupts, if any.

    sa_new.sa_handler = ComplianceAnalyzerApp::HandleSignal;
    sigemptyset(&sa_new.sa_mask);
    sa_new.sa_flags = 0;
    sigaction(SIGINT, &sa_new, &sa_old);

    ComplianceAnalyzerApp::had_signal_= false;

    // If some kind of system error occurs, it may affect more than 1 of
    // our our tasks so let's check each of them and log any exceptions
    // which occur. We'll then rethrow our first exception.

    std::exception_ptr ep{nullptr};

    std::tuple<int, int, int> counters{0, 0, 0};  // success, skips, errors

    // keep track of our async processes here.

    std::vector<std::future<std::tuple<int, int, int>>> tasks;
    tasks.reserve(max_at_a_time_);

    // prime the pump...

    size_t current_file{0};
    for ( ; static_cast<int>(tasks.size()) < max_at_a_time_ && current_file < list_of_files_to_process_.size(); ++current_file)
    {
        tasks.emplace_back(std::async(std::launch::async, &ComplianceAnalyzerApp::AnalyzeFileAsync, this,
            CA::FileName{Trim(list_of_files_to_process_[current_file])}));
    }

    int continue_here{0};
    int ready_task{-1};

    for ( ; current_file < list_of_files_to_process_.size(); ++current_file)
    {
        // we want to keep max_at_a_time_ tasks going so, as one finishes,
        // we replace it with another

        ready_task = wait_for_any(tasks, continue_here, std::chrono::microseconds{100});
        if (ready_task < 0)
        {
            break;
        }
        try
        {
            auto result = tasks[ready_task].get();
            counters = AddTs(counters, result);
        }
        catch (std::system_error& e)
        {
            // any system problems, we eventually abort, but only after finishing work in process.

            spdlog::error(e.what());
            auto ec = e.code();
            spdlog::error(catenate("Category: ", ec.category().name(), ". Value: ", ec.value(),
                    ". Message: ", ec.message()));
            counters = AddTs(counters, {0, 0, 1});

            // OK, let's be sure this propagates

            ep = std::current_exception();
            break;
        }
        catch (std::exception& e)
        {
            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});

            if (! ep)
            {
                ep = std::current_exception();
            }
        }

        if (ComplianceAnalyzerApp::had_signal_)
        {
            break;
        }

        //  let's keep going

        tasks[ready_task] = std::async(std::launch::async, &ComplianceAnalyzerApp::AnalyzeFileAsync, this,
                CA::FileName{Trim(list_of_files_to_process_[current_file])});
        continue_here = (ready_task + 1) % max_at_a_time_;
        ready_task = -1;
    }

    // need to clean up the last set of tasks

    for(int i = 0; i < static_cast<int>(tasks.size()); ++i)
    {
        try
        {
            if (ready_task > -1 && i == ready_task)
            {
                continue;
            }
            if (tasks[i].valid())
            {
                auto result = tasks[i].get();
                counters = AddTs(counters, result);
            }
        }
        catch(std::exception& e)
        {
            spdlog::error(e.what());
            counters = AddTs(counters, {0, 0, 1});
            if (! ep)
            {
                ep = std::current_exception();
            }
        }
    }

    sigaction(SIGINT, &sa_old, 0);

    auto [success_counter, skipped_counter, error_counter] = counters;

    if (ep)
    {
        spdlog::error(catenate("Analyzed: ", SumT(counters), " documents. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        std::rethrow_exception(ep);
    }

    if (ComplianceAnalyzerApp::had_signal_)
    {
        spdlog::error(catenate("Analyzed: ", SumT(counters), " documents. Successes: ", success_counter,
                ". Skips: ", skipped_counter, ". Errors: ", error_counter, "."));
        throw std::runtime_error("Received keyboard interrupt.  Processing manually terminated after analyzing: "
            + std::to_string(success_counter) + " documents.");
    }

    return counters;
}		/* -----  end of method ComplianceAnalyzerApp::AnalyzeFilesFromListConcurrently  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ComplianceAnalyzerApp
 *      Method:  ComplianceAnalyzerApp::WriteResult
 * Description:  empty output path means stdout.
 *--------------------------------------------------------------------------------------
 */
void ComplianceAnalyzerApp::WriteResult (const OrderedJSON& result, const fs::path& output_path) const
{
    // text pulled from a PDF is not guaranteed to be valid UTF-8.

    const std::string output = result.dump(indent_, ' ', false, OrderedJSON::error_handler_t::replace);

    if (output_path.empty())
    {
        std::cout << output << '\n';
        return;
    }

    std::ofstream result_file(output_path);
    if (! result_file)
    {
        throw std::runtime_error(catenate("Can't open output file: ", output_path));
    }

    // the disk could be full or some other problem could occur so, let's check..

    errno = 0;
    result_file.write(output.data(), output.size());
    result_file.put('\n');
    result_file.close();
    if (result_file.fail())
    {
        std::error_code err{errno, std::system_category()};
        throw std::system_error{err, catenate("Unable to complete write of result: ", output_path)};
    }
}		/* -----  end of method ComplianceAnalyzerApp::WriteResult  ----- */

void ComplianceAnalyzerApp::HandleSignal(int signal)

{
    std::signal(SIGINT, ComplianceAnalyzerApp::HandleSignal);

    // only thing we need to do

    ComplianceAnalyzerApp::had_signal_ = true;

}		/* -----  end of method ComplianceAnalyzerApp::HandleSignal  ----- */

void ComplianceAnalyzerApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method ComplianceAnalyzerApp::Shutdown  -----
