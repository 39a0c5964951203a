/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <gavel/chain/database.hpp>
#include <gavel/chain/time_source.hpp>

#include <gavel/protocol/derived_authority.hpp>
#include <gavel/protocol/transaction.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

using namespace gavel::chain;
namespace bpo = boost::program_options;

namespace gavel { namespace replay {

   /** one transaction of a scenario, applied after the clock moved forward */
   struct replay_step
   {
      uint32_t               advance_seconds = 0;
      vector<string>         signers;
      vector<operation>      operations;
      bool                   expect_failure = false;
   };

   struct replay_scenario
   {
      genesis_state_type     genesis;
      time_point_sec         start_time;
      vector<replay_step>    steps;
   };

   /** keys are named, the same name always regenerates the same key */
   private_key_type key_for_name( const string& name )
   {
      return fc::ecc::private_key::regenerate( fc::sha256::hash( name ) );
   }

} }

FC_REFLECT( gavel::replay::replay_step, (advance_seconds)(signers)(operations)(expect_failure) )
FC_REFLECT( gavel::replay::replay_scenario, (genesis)(start_time)(steps) )

using namespace gavel::replay;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Print to the console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

fc::log_level string_to_level( const string& level )
{
   fc::log_level result;
   if(level == "info")
      result = fc::log_level::info;
   else if(level == "debug")
      result = fc::log_level::debug;
   else if(level == "warn")
      result = fc::log_level::warn;
   else if(level == "error")
      result = fc::log_level::error;
   else if(level == "all")
      result = fc::log_level::all;
   else
      FC_THROW("Log level not allowed. Allowed levels are info, debug, warn, error and all.");

   return result;
}

void setup_logging( const string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::debug,
         fc::console_appender::color::green));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::warn,
         fc::console_appender::color::brown));
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color(fc::log_level::error,
         fc::console_appender::color::red));
   cfg.appenders.push_back(fc::appender_config( "default", "console", fc::variant(console_appender_config, 20)));
   cfg.loggers = { fc::logger_config("default") };
   cfg.loggers.front().level = string_to_level(console_level);
   cfg.loggers.front().appenders = {"default"};
   fc::configure_logging( cfg );
}

/// command line and config.ini values override the scenario's genesis parameters
void apply_parameter_overrides( const bpo::variables_map& options, chain_parameters& params )
{
   if( options.count("protocol-id") > 0 )
      params.protocol_id = identity( options["protocol-id"].as<string>() );
   if( options.count("authority-label") > 0 )
      params.authority_label = options["authority-label"].as<string>();
   if( options.count("rent-lamports-per-byte-year") > 0 )
      params.rent.lamports_per_byte_year = options["rent-lamports-per-byte-year"].as<uint64_t>();
   if( options.count("rent-exemption-years") > 0 )
      params.rent.exemption_threshold_years = options["rent-exemption-years"].as<uint64_t>();
}

/// @return the number of steps whose outcome was not the expected one
uint32_t replay( const replay_scenario& scenario, const bpo::variables_map& options )
{
   genesis_state_type genesis = scenario.genesis;
   apply_parameter_overrides( options, genesis.initial_parameters );

   database db;
   auto clock = std::make_shared<manual_time_source>( scenario.start_time );
   db.set_time_source( clock );
   db.init_genesis( genesis );

   uint32_t unexpected = 0;
   uint32_t step_num = 0;
   for( const auto& step : scenario.steps )
   {
      ++step_num;
      clock->advance( step.advance_seconds );

      signed_transaction trx;
      trx.operations = step.operations;
      for( const auto& name : step.signers )
         trx.sign( key_for_name( name ), db.get_chain_id() );

      try
      {
         auto processed = db.push_transaction( trx );
         ilog( "step ${n} at ${t} applied: ${r}",
               ("n",step_num)("t",db.now())("r",processed.operation_results) );
         if( step.expect_failure )
         {
            elog( "step ${n} was expected to fail", ("n",step_num) );
            ++unexpected;
         }
      }
      catch( const fc::exception& e )
      {
         if( step.expect_failure )
            ilog( "step ${n} rejected as expected: ${e}", ("n",step_num)("e",e.to_string()) );
         else
         {
            elog( "step ${n} failed:\n${e}", ("n",step_num)("e",e.to_detail_string()) );
            ++unexpected;
         }
      }
   }
   return unexpected;
}

/// The main program
int main(int argc, char** argv) {
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Gavel Auction Replay");
      bpo::options_description cfg_options("Gavel Auction Replay");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("auction_replay_data_dir"),
                    "Directory containing the configuration file and scenarios")
            ("print-identity", bpo::value<std::string>(),
                    "Print the identity and private key of a named key and exit");
      cfg_options.add_options()
            ("scenario,s", bpo::value<std::string>(), "JSON scenario to replay, relative to data-dir")
            ("protocol-id", bpo::value<std::string>(), "Auction protocol identity (64 hex digits)")
            ("authority-label", bpo::value<std::string>(), "Label of derived auction authorities")
            ("rent-lamports-per-byte-year", bpo::value<uint64_t>(), "Storage rent per byte and year")
            ("rent-exemption-years", bpo::value<uint64_t>(), "Years of rent an account must hold to be exempt")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Console log level: info, debug, warn, error or all");
      app_options.add(cfg_options);

      bpo::variables_map options;
      try
      {
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      if( options.count("print-identity") > 0 )
      {
         disable_default_logging();
         auto name = options["print-identity"].as<std::string>();
         auto key = key_for_name( name );
         std::stringstream ss;
         ss << name << " " << std::string( identity( key.get_public_key() ) )
            << " " << key.get_secret().str();
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      fc::path data_dir;
      if( options.count("data-dir") > 0 )
      {
         data_dir = options["data-dir"].as<boost::filesystem::path>();
         if( data_dir.is_relative() )
            data_dir = fc::current_path() / data_dir;
      }

      fc::path config_ini_path = data_dir / "config.ini";
      if( fc::exists(config_ini_path) )
      {
         // values given on the command line take precedence
         bpo::store(bpo::parse_config_file<char>(config_ini_path.preferred_string().c_str(), cfg_options, true), options);
      }
      bpo::notify(options);

      setup_logging( options["log-level"].as<std::string>() );

      FC_ASSERT( options.count("scenario") > 0, "No scenario given, use --scenario or set it in config.ini" );
      fc::path scenario_path = options["scenario"].as<std::string>();
      if( scenario_path.is_relative() )
         scenario_path = data_dir / scenario_path;
      ilog( "Replaying ${p}", ("p",scenario_path.preferred_string()) );

      auto scenario = fc::json::from_file( scenario_path ).as<replay_scenario>( GAVEL_MAX_NESTED_OBJECTS );
      auto unexpected = replay( scenario, options );

      ilog( "Replayed ${n} steps, ${u} with an unexpected outcome", ("n",scenario.steps.size())("u",unexpected) );
      return unexpected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if (unhandled_exception)
   {
      elog("Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()));
      return EXIT_FAILURE;
   }
   return EXIT_FAILURE;
}
