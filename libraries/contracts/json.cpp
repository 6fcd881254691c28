#include <multitest/contracts/json.hpp>

#include <google/protobuf/util/json_util.h>

namespace multitest::contracts {

bytes proto_to_json_binary( const google::protobuf::Message& msg )
{
   google::protobuf::util::JsonPrintOptions options;
   options.preserve_proto_field_names = true;

   std::string out;
   auto status = google::protobuf::util::MessageToJsonString( msg, &out, options );
   MULTITEST_ASSERT( status.ok(), parse_error, "unable to encode ${type} as json: ${error}", ("type", msg.GetTypeName())("error", status.ToString()) );

   return out;
}

void proto_from_json_binary( const bytes& b, google::protobuf::Message& msg )
{
   google::protobuf::util::JsonParseOptions options;
   options.ignore_unknown_fields = false;

   auto status = google::protobuf::util::JsonStringToMessage( b, &msg, options );
   MULTITEST_ASSERT( status.ok(), parse_error, "${error}", ("error", status.ToString()) );
}

nlohmann::json proto_to_json( const google::protobuf::Message& msg )
{
   return nlohmann::json::parse( proto_to_json_binary( msg ) );
}

void proto_from_json( const nlohmann::json& j, google::protobuf::Message& msg )
{
   proto_from_json_binary( j.dump(), msg );
}

} // multitest::contracts
