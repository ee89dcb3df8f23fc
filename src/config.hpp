#ifndef DNSSEC_CONFIG_HPP
#define DNSSEC_CONFIG_HPP

#include "resolverclient.hpp"
#include "trustanchor.hpp"
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dnssec
{
    class ConfigError : public std::runtime_error
    {
    public:
        ConfigError( const std::string &msg ) : std::runtime_error( msg )
        {
        }
    };

    struct TLSParameters {
        unsigned int mTimeoutMSec;
        uint16_t     mPort;
        std::string  mProtocol;

        TLSParameters() : mTimeoutMSec( 10000 ), mPort( 443 ), mProtocol( "tcp" )
        {
        }
    };

    struct BulkParameters {
        unsigned int mThreads;
        unsigned int mMaxDomains;

        BulkParameters() : mThreads( 4 ), mMaxDomains( 100 )
        {
        }
    };

    struct Config {
        ResolverParameters mResolver;
        unsigned int       mDeadlineMSec;
        TLSParameters      mTLS;
        BulkParameters     mBulk;
        std::string        mLogLevel;
        TrustAnchorSetPtr  mTrustAnchors;

        Config() : mDeadlineMSec( 15000 ), mLogLevel( "warning" ), mTrustAnchors( TrustAnchorSet::createDefault() )
        {
        }
    };

    /*
      resolver:
        address: 8.8.8.8
        port: 53
        timeout_ms: 2000
        retries: 2
        tcp_fallback: true
      request:
        deadline_ms: 15000
      tls:
        timeout_ms: 10000
        port: 443
        protocol: tcp
      bulk:
        threads: 4
        max_domains: 100
      log:
        level: warning
      trust_anchors:
        version: root-2024
        anchors:
          - zone: .
            key_tag: 20326
            algorithm: 8
            digest_type: 2
            digest: E06D44B80B8F1D39A95C0B0D7C65D08458E880409BBC683457104237C7F8EC8D
          - zone: example.com
            flags: 257
            protocol: 3
            algorithm: 13
            public_key: <base64>
    */
    Config loadConfig( const std::string &yaml );
    Config loadConfigFile( const std::string &filename );

    TrustAnchorSetPtr loadTrustAnchors( const YAML::Node &node );

    template <typename TYPE>
    TYPE loadParameter( const YAML::Node &node, const std::string &param_name )
    {
        if ( !node[ param_name ] )
            throw ConfigError( param_name + " must be specified" );
        try {
            return node[ param_name ].as<TYPE>();
        }
        catch ( YAML::Exception &e ) {
            throw ConfigError( "invalid value of " + param_name + ": " + e.what() );
        }
    }

    template <typename TYPE>
    TYPE loadParameter( const YAML::Node &node, const std::string &param_name, const TYPE &default_value )
    {
        if ( !node[ param_name ] )
            return default_value;
        return loadParameter<TYPE>( node, param_name );
    }
}

#endif
