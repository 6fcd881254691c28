#include <boost/test/unit_test.hpp>

#include <multitest/contracts/contract_wrapper.hpp>
#include <multitest/contracts/customize.hpp>
#include <multitest/contracts/testing.hpp>

#include <multitest/tests/sample_contracts.hpp>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace multitest;
using namespace multitest::contracts;
using namespace multitest::tests;

namespace {

// Runs fn in a child process and reports whether the child died from SIGABRT
bool aborts( const std::function< void() >& fn )
{
   pid_t pid = fork();
   BOOST_REQUIRE( pid >= 0 );

   if ( pid == 0 )
   {
      std::signal( SIGABRT, SIG_DFL );

      // The child must never unwind back into the test runner
      try
      {
         fn();
      }
      catch ( ... )
      {
         std::_Exit( 1 );
      }

      std::_Exit( 0 );
   }

   int status = 0;
   BOOST_REQUIRE_EQUAL( waitpid( pid, &status, 0 ), pid );
   return WIFSIGNALED( status ) && WTERMSIG( status ) == SIGABRT;
}

response<> baseline_response()
{
   wasm_msg wasm;
   wasm.mutable_execute()->set_contract_addr( "other" );
   wasm.mutable_execute()->set_msg( "{}" );

   staking_msg staking;
   staking.mutable_delegate()->set_validator( "validator" );
   *staking.mutable_delegate()->mutable_amount() = make_coin( "100", constants::bonded_denom );

   distribution_msg distribution;
   distribution.mutable_set_withdraw_address()->set_address( "withdraw" );

   ibc_msg ibc;
   ibc.mutable_close_channel()->set_channel_id( "channel-0" );

   stargate_msg stargate;
   stargate.set_type_url( "/cosmos.gov.v1beta1.MsgVote" );
   stargate.set_value( "vote" );

   response<> res;
   res.add_message( wasm )
      .add_submessage( sub_msg<>::reply_always( make_send( "alice", "5" ), 3 ).with_gas_limit( 5000 ) )
      .add_submessage( sub_msg<>::reply_on_error( staking, 4 ) )
      .add_message( distribution )
      .add_message( ibc )
      .add_message( stargate )
      .add_attribute( "key", "value" )
      .add_event( make_event( "wasm-transfer" ) )
      .set_data( "payload" );
   return res;
}

response<> reply_baseline( deps_mut<> ctx, const env&, const reply& r )
{
   ctx.storage.set( "reply", std::to_string( r.id() ) );
   return baseline_response();
}

} // anonymous

struct customize_fixture
{
   customize_fixture()
   {
      call_counters::reset();
   }

   mock_dependencies mocks;
   env               e = mock_env();
};

BOOST_FIXTURE_TEST_SUITE( customize_tests, customize_fixture )

BOOST_AUTO_TEST_CASE( lift_response_test )
{ try {
   BOOST_TEST_MESSAGE( "Lifting keeps every universal and pass through message and all other fields" );
   auto original = baseline_response();
   auto lifted = customize_response< chain_msg >( baseline_response() );

   BOOST_REQUIRE_EQUAL( lifted.messages.size(), original.messages.size() );
   for ( std::size_t i = 0; i < original.messages.size(); i++ )
   {
      BOOST_REQUIRE_EQUAL( lifted.messages[i].id, original.messages[i].id );
      BOOST_REQUIRE( lifted.messages[i].gas_limit == original.messages[i].gas_limit );
      BOOST_REQUIRE( lifted.messages[i].reply_on == original.messages[i].reply_on );
      BOOST_REQUIRE_EQUAL( lifted.messages[i].msg.index(), original.messages[i].msg.index() );
   }

   BOOST_REQUIRE( std::get< wasm_msg >( lifted.messages[0].msg ) == std::get< wasm_msg >( original.messages[0].msg ) );
   BOOST_REQUIRE( std::get< bank_msg >( lifted.messages[1].msg ) == make_send( "alice", "5" ) );
   BOOST_REQUIRE_EQUAL( *lifted.messages[1].gas_limit, 5000 );
   BOOST_REQUIRE( std::get< staking_msg >( lifted.messages[2].msg ) == std::get< staking_msg >( original.messages[2].msg ) );
   BOOST_REQUIRE( std::get< distribution_msg >( lifted.messages[3].msg ) == std::get< distribution_msg >( original.messages[3].msg ) );
   BOOST_REQUIRE( std::get< ibc_msg >( lifted.messages[4].msg ) == std::get< ibc_msg >( original.messages[4].msg ) );
   BOOST_REQUIRE( std::get< stargate_msg >( lifted.messages[5].msg ) == std::get< stargate_msg >( original.messages[5].msg ) );

   BOOST_REQUIRE( lifted.attributes == original.attributes );
   BOOST_REQUIRE( lifted.events == original.events );
   BOOST_REQUIRE( lifted.data == original.data );

   BOOST_TEST_MESSAGE( "An empty response lifts to an empty response" );
   BOOST_REQUIRE( customize_response< chain_msg >( response<>{} ) == response< chain_msg >{} );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( aborts_helper_test )
{ try {
   BOOST_TEST_MESSAGE( "A child that throws exits without aborting and without reaching the runner" );
   BOOST_REQUIRE( !aborts( []()
   {
      throw std::runtime_error( "thrown instead of aborting" );
   } ) );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( response_builder_test )
{ try {
   BOOST_TEST_MESSAGE( "Batches of attributes, events and submessages are appended in order" );
   std::vector< attribute > attributes;
   for ( const auto& [ key, value ] : { std::pair{ "a", "1" }, std::pair{ "b", "2" } } )
   {
      attribute a;
      a.set_key( key );
      a.set_value( value );
      attributes.push_back( a );
   }

   std::vector< event > events { make_event( "first" ), make_event( "second" ) };
   std::vector< sub_msg<> > messages {
      sub_msg<>::create( make_send( "alice", "1" ) ),
      sub_msg<>::reply_on_error( make_send( "bob", "2" ), 8 )
   };

   response<> res;
   res.add_attribute( "leading", "0" )
      .add_attributes( attributes.begin(), attributes.end() )
      .add_events( events.begin(), events.end() )
      .add_submessages( messages.begin(), messages.end() );

   BOOST_REQUIRE_EQUAL( res.attributes.size(), 3 );
   BOOST_REQUIRE_EQUAL( res.attributes[0].key(), "leading" );
   BOOST_REQUIRE( res.attributes[2] == attributes[1] );
   BOOST_REQUIRE( res.events == events );
   BOOST_REQUIRE( res.messages == messages );

   BOOST_TEST_MESSAGE( "Batched responses survive lifting" );
   auto lifted = customize_response< chain_msg >( std::move( res ) );
   BOOST_REQUIRE_EQUAL( lifted.messages.size(), 2 );
   BOOST_REQUIRE_EQUAL( lifted.messages[1].id, 8 );
   BOOST_REQUIRE( lifted.messages[1].reply_on == reply_on::error );
   BOOST_REQUIRE( lifted.events == events );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( bridged_reply_test )
{ try {
   BOOST_TEST_MESSAGE( "A bridged reply behaves like decustomizing the context and lifting the result" );
   auto wrapper = make_contract_wrapper( &execute_custom, &instantiate_custom, &query_custom ).with_reply_empty( &reply_baseline );
   BOOST_REQUIRE( wrapper.has_reply() );

   reply r;
   r.set_id( 12 );
   r.set_error( "out of gas" );

   auto ctx = mocks.as_mut< chain_query >();
   auto bridged = wrapper.reply( ctx, e, r );
   BOOST_REQUIRE_EQUAL( *mocks.storage.get( "reply" ), "12" );

   auto expected = customize_response< chain_msg >( reply_baseline( decustomize_deps_mut( ctx ), e, r ) );
   BOOST_REQUIRE( bridged == expected );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( bridged_wrapper_test )
{ try {
   BOOST_TEST_MESSAGE( "Baseline entry points serve a caller that uses a chain extension" );
   auto wrapper = make_contract_wrapper_with_empty< chain_msg, chain_query >( &execute_ok, &instantiate_ok, &query_ok )
      .with_sudo_empty( &sudo_ok )
      .with_migrate_empty( &migrate_ok );

   std::unique_ptr< contract< chain_msg, chain_query > > boxed = box_contract( wrapper );

   auto res = boxed->execute( mocks.as_mut< chain_query >(), e, mock_info( "bob" ), R"({"amount":8})" );
   BOOST_REQUIRE_EQUAL( call_counters::execute, 1 );
   BOOST_REQUIRE_EQUAL( res.messages.size(), 1 );
   BOOST_REQUIRE( std::get< bank_msg >( res.messages[0].msg ) == make_send( "bob", "8" ) );

   auto out = boxed->query( mocks.as_ref< chain_query >(), e, "{}" );
   BOOST_REQUIRE_EQUAL( nlohmann::json::parse( out )[ "count" ], "8" );

   auto sudo_res = boxed->sudo( mocks.as_mut< chain_query >(), e, R"({"amount":1})" );
   BOOST_REQUIRE_EQUAL( sudo_res.attributes[0].value(), "sudo" );

   BOOST_REQUIRE_THROW( boxed->reply( mocks.as_mut< chain_query >(), e, reply() ), not_implemented_error );
   BOOST_REQUIRE_EQUAL( boxed->migrate( mocks.as_mut< chain_query >(), e, "{}" ).attributes[0].value(), "migrate" );

   BOOST_TEST_MESSAGE( "Format errors are still reported by the bridged wrapper" );
   BOOST_REQUIRE_THROW( boxed->execute( mocks.as_mut< chain_query >(), e, mock_info(), "{" ), message_format_error );
   BOOST_REQUIRE_EQUAL( call_counters::execute, 1 );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( decustomize_deps_test )
{ try {
   BOOST_TEST_MESSAGE( "Dropping the query extension keeps the same storage, api and querier" );
   mocks.querier.set_balance( "alice", { make_coin( "17", "ucosm" ) } );

   auto ctx = mocks.as_mut< chain_query >();
   auto plain = decustomize_deps_mut( ctx );

   BOOST_REQUIRE( &plain.storage == &ctx.storage );
   BOOST_REQUIRE( &plain.api == &ctx.api );
   BOOST_REQUIRE( &plain.querier.inner() == &ctx.querier.inner() );
   BOOST_REQUIRE( plain.querier.query_balance( "alice", "ucosm" ) == make_coin( "17", "ucosm" ) );

   plain.storage.set( "k", "v" );
   BOOST_REQUIRE_EQUAL( *ctx.storage.get( "k" ), "v" );

   auto ref = decustomize_deps( mocks.as_ref< chain_query >() );
   BOOST_REQUIRE( &ref.querier.inner() == &mocks.querier );
   BOOST_REQUIRE_EQUAL( *ref.storage.get( "k" ), "v" );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( custom_message_aborts_test )
{ try {
   BOOST_TEST_MESSAGE( "Lifting a custom message out of a baseline response aborts the process" );
   BOOST_REQUIRE( aborts( []()
   {
      response<> res;
      res.add_message( custom_msg< empty >{} );
      customize_response< chain_msg >( std::move( res ) );
   } ) );

   BOOST_TEST_MESSAGE( "The same holds when the baseline entry point runs behind a wrapper" );
   auto wrapper = make_contract_wrapper( &execute_custom, &instantiate_custom, &query_custom ).with_reply_empty( &reply_emits_custom );
   BOOST_REQUIRE( aborts( [&]()
   {
      mock_dependencies child_mocks;
      wrapper.reply( child_mocks.as_mut< chain_query >(), mock_env(), reply() );
   } ) );

   BOOST_TEST_MESSAGE( "A well behaved baseline response does not abort" );
   BOOST_REQUIRE( !aborts( []()
   {
      customize_response< chain_msg >( baseline_response() );
   } ) );

} MULTITEST_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
