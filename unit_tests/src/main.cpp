#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <string>

extern std::string keyfile;
extern std::string hostname;
extern std::string bucket_name;

int main( int argc, char* argv[] )
{
  Catch::Session session; // There must be exactly one instance

  // Build a new parser on top of Catch's.  The options are only used by the
  // tests tagged [live], which are hidden unless selected.
  using namespace Catch::clara;
  auto cli
    = session.cli() // Get Catch's composite command line parser
    | Opt( hostname, "hostname" )
        ["--hostname"]
        ("the S3 host (default: s3.amazonaws.com)")
    | Opt( keyfile, "keyfile" )
        ["--keyfile"]
        ("the file holding the access key and secret access key")
    | Opt( bucket_name, "bucket" )
        ["--bucket"]
        ("an existing bucket the live tests may write to");

  // Now pass the new composite back to Catch so it uses that
  session.cli( cli );

  int returnCode = session.applyCommandLine( argc, argv );
  if( returnCode != 0 ) // Indicates a command line error
        return returnCode;

  // numFailed is clamped to 255 as some unices only use the lower 8 bits.
  return session.run();
}
