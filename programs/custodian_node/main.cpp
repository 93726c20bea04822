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

#include <custodian/app/database_api.hpp>
#include <custodian/chain/database.hpp>
#include <custodian/chain/database_ledger.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

using namespace custodian::chain;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Log to stderr at the given level and above
void configure_console_logging( const std::string& level )
{
   fc::console_appender::config console_config;
   console_config.stream = fc::console_appender::stream::std_error;

   fc::logging_config logging;
   logging.appenders.push_back( fc::appender_config( "stderr", "console",
                                                     fc::variant( console_config, CUSTODIAN_MAX_NESTED_OBJECTS ) ) );

   fc::logger_config logger( "default" );
   logger.level = fc::variant( level ).as<fc::log_level>( 1 );
   logger.appenders.push_back( "stderr" );
   logging.loggers.push_back( logger );

   fc::configure_logging( logging );
}

/// Hack to log messages to console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

/// A factory run by three well known principals, used when no genesis file is given
genesis_state_type create_example_genesis()
{
   genesis_state_type genesis;
   genesis.initial_timestamp = fc::time_point_sec( fc::time_point::now() );
   genesis.owner             = "factory-owner";
   genesis.fee_collector     = "fee-collector";
   genesis.arbitrator        = "arbitrator";
   genesis.default_fee_bips  = CUSTODIAN_DEFAULT_FEE_BIPS;
   return genesis;
}

/**
 *  Replays the steps of a script against the database. Each step is an object with one of the keys
 *  "operation" ([tag, {...}]), "advance" (seconds), "issue" ({owner, amount}) or
 *  "approve" ({owner, spender, amount}).
 */
void run_script( database& db, const fc::path& script )
{ try {
   const fc::variants steps = fc::json::from_file( script ).get_array();
   database_ledger ledger( db );

   uint32_t step_num = 0;
   for( const fc::variant& v : steps )
   {
      ++step_num;
      const fc::variant_object& step = v.get_object();
      try {
         if( step.contains( "operation" ) )
         {
            const auto op = step["operation"].as<operation>( CUSTODIAN_MAX_NESTED_OBJECTS );
            const operation_result result = db.apply_operation( op );
            ilog( "Step ${n}: applied ${op}, result ${r}", ("n", step_num)("op", op)("r", result) );
         }
         else if( step.contains( "advance" ) )
         {
            db.advance_time( step["advance"].as<uint32_t>( 1 ) );
            ilog( "Step ${n}: clock is now ${t}", ("n", step_num)("t", db.head_time()) );
         }
         else if( step.contains( "issue" ) )
         {
            const auto issue = step["issue"].as<genesis_state_type::initial_balance_type>( CUSTODIAN_MAX_NESTED_OBJECTS );
            ledger.issue( issue.owner, issue.amount );
            ilog( "Step ${n}: issued ${a} to ${o}", ("n", step_num)("a", issue.amount)("o", issue.owner) );
         }
         else if( step.contains( "approve" ) )
         {
            const auto approval = step["approve"].as<genesis_state_type::initial_allowance_type>(
                                     CUSTODIAN_MAX_NESTED_OBJECTS );
            ledger.approve( approval.owner, approval.spender, approval.amount );
            ilog( "Step ${n}: ${o} approved ${s} for ${a}",
                  ("n", step_num)("o", approval.owner)("s", approval.spender)("a", approval.amount) );
         }
         else
            FC_THROW( "Unknown script step ${s}", ("s", step) );
      }
      catch( const fc::exception& e )
      {
         // a failed operation leaves no trace, the script goes on with the next step
         wlog( "Step ${n} failed: ${e}", ("n", step_num)("e", e.to_string()) );
      }
   }
} FC_CAPTURE_AND_RETHROW( (script) ) }

/// The main program
int main( int argc, char** argv )
{
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options("Custodian Node");
      bpo::options_description cfg_options("Custodian Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value("custodian_node_data_dir"),
                    "Directory containing the database and the configuration file");
      cfg_options.add_options()
            ("genesis-json", bpo::value<boost::filesystem::path>(), "File to read Genesis State from")
            ("script", bpo::value<boost::filesystem::path>(), "JSON file with the steps to replay")
            ("log-level", bpo::value<std::string>()->default_value("info"),
                    "Lowest level of the messages logged: debug, info, warn or error");
      app_options.add( cfg_options );

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
      }
      catch( const boost::program_options::error& e )
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

      fc::path data_dir;
      if( options.count("data-dir") > 0 )
      {
         data_dir = options["data-dir"].as<boost::filesystem::path>();
         if( data_dir.is_relative() )
            data_dir = fc::current_path() / data_dir;
      }

      const fc::path config_ini_path = data_dir / "config.ini";
      if( fc::exists( config_ini_path ) )
         bpo::store( bpo::parse_config_file<char>( config_ini_path.preferred_string().c_str(), cfg_options, true ),
                     options );
      bpo::notify( options );

      configure_console_logging( options.at("log-level").as<std::string>() );

      auto initial_state = [&options] {
         ilog( "Initializing database..." );
         if( options.count("genesis-json") )
            return fc::json::from_file( options.at("genesis-json").as<boost::filesystem::path>() )
                  .as<genesis_state_type>( CUSTODIAN_MAX_NESTED_OBJECTS );
         return create_example_genesis();
      };

      database db;
      db.open( data_dir, initial_state );

      db.published_event.connect( []( const applied_event& e ) {
         ilog( "Event ${seq} from ${src}: ${e}", ("seq", e.sequence)("src", e.source)("e", e.event) );
      });

      if( options.count("script") )
         run_script( db, options.at("script").as<boost::filesystem::path>() );

      const custodian::app::database_api api( db );
      std::cout << fc::json::to_pretty_string( fc::variant( api.get_factory_stats(), CUSTODIAN_MAX_NESTED_OBJECTS ) )
                << "\n";

      db.close();
      ilog( "Closed database in ${d}", ("d", data_dir) );
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()) );
      return EXIT_FAILURE;
   }
   return EXIT_FAILURE;
}
