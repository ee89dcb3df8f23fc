#include "config.hpp"
#include "logger.hpp"
#include <fstream>
#include <iterator>

namespace dnssec
{
    static TrustAnchor loadTrustAnchor( const YAML::Node &node )
    {
        TrustAnchor anchor;
        try {
            anchor.mZone = Domainname( loadParameter<std::string>( node, "zone" ) );
        }
        catch ( DomainnameError &e ) {
            throw ConfigError( std::string( "invalid trust anchor zone: " ) + e.what() );
        }

        uint8_t algorithm = loadParameter<unsigned int>( node, "algorithm" );
        try {
            if ( node[ "digest" ] ) {
                PacketData digest;
                decodeFromHex( loadParameter<std::string>( node, "digest" ), digest );
                anchor.mDS = std::make_shared<RecordDS>( loadParameter<unsigned int>( node, "key_tag" ),
                                                         algorithm,
                                                         loadParameter<unsigned int>( node, "digest_type" ),
                                                         digest );
            } else if ( node[ "public_key" ] ) {
                PacketData public_key;
                decodeFromBase64( loadParameter<std::string>( node, "public_key" ), public_key );
                anchor.mDNSKEY = std::make_shared<RecordDNSKEY>( loadParameter<unsigned int>( node, "flags" ),
                                                                 algorithm,
                                                                 public_key,
                                                                 loadParameter<unsigned int>( node, "protocol", 3 ) );
            } else {
                throw ConfigError( "trust anchor of " + anchor.mZone.toString() + " needs digest or public_key" );
            }
        }
        catch ( EncodingError &e ) {
            throw ConfigError( "invalid trust anchor of " + anchor.mZone.toString() + ": " + e.what() );
        }
        return anchor;
    }

    TrustAnchorSetPtr loadTrustAnchors( const YAML::Node &node )
    {
        if ( !node || !node[ "anchors" ] )
            return TrustAnchorSet::createDefault();

        std::string              version = loadParameter<std::string>( node, "version", "custom" );
        std::vector<TrustAnchor> anchors;
        const YAML::Node &       anchor_nodes = node[ "anchors" ];
        if ( !anchor_nodes.IsSequence() )
            throw ConfigError( "trust_anchors.anchors must be a list" );
        for ( auto anchor_node = anchor_nodes.begin(); anchor_node != anchor_nodes.end(); anchor_node++ ) {
            anchors.push_back( loadTrustAnchor( *anchor_node ) );
        }

        std::shared_ptr<const TrustAnchorSet> anchor_set = std::make_shared<const TrustAnchorSet>( version, anchors );
        if ( !anchor_set->hasAnchor( Domainname( "." ) ) )
            throw ConfigError( "trust_anchors.anchors must contain an anchor of the root zone" );
        return anchor_set;
    }

    Config loadConfig( const std::string &yaml )
    {
        YAML::Node top;
        try {
            top = YAML::Load( yaml );
        }
        catch ( YAML::ParserException &e ) {
            throw ConfigError( std::string( "cannot parse config: " ) + e.what() );
        }

        Config config;
        if ( top.IsNull() )
            return config;
        if ( !top.IsMap() )
            throw ConfigError( "config must be a map" );

        if ( top[ "resolver" ] ) {
            const YAML::Node resolver          = top[ "resolver" ];
            config.mResolver.mAddress     = loadParameter<std::string>( resolver, "address", config.mResolver.mAddress );
            config.mResolver.mPort        = loadParameter<uint16_t>( resolver, "port", config.mResolver.mPort );
            config.mResolver.mTimeoutMSec = loadParameter<unsigned int>( resolver, "timeout_ms", config.mResolver.mTimeoutMSec );
            config.mResolver.mRetries     = loadParameter<unsigned int>( resolver, "retries", config.mResolver.mRetries );
            config.mResolver.mTCPFallback = loadParameter<bool>( resolver, "tcp_fallback", config.mResolver.mTCPFallback );
            try {
                convertAddressStringToBinary( config.mResolver.mAddress );
            }
            catch ( InvalidAddressFormatError &e ) {
                throw ConfigError( "resolver.address must be an IPv4 address: " + config.mResolver.mAddress );
            }
        }
        if ( top[ "request" ] ) {
            config.mDeadlineMSec = loadParameter<unsigned int>( top[ "request" ], "deadline_ms", config.mDeadlineMSec );
        }
        if ( top[ "tls" ] ) {
            const YAML::Node tls     = top[ "tls" ];
            config.mTLS.mTimeoutMSec = loadParameter<unsigned int>( tls, "timeout_ms", config.mTLS.mTimeoutMSec );
            config.mTLS.mPort        = loadParameter<uint16_t>( tls, "port", config.mTLS.mPort );
            config.mTLS.mProtocol    = loadParameter<std::string>( tls, "protocol", config.mTLS.mProtocol );
        }
        if ( top[ "bulk" ] ) {
            const YAML::Node bulk     = top[ "bulk" ];
            config.mBulk.mThreads    = loadParameter<unsigned int>( bulk, "threads", config.mBulk.mThreads );
            config.mBulk.mMaxDomains = loadParameter<unsigned int>( bulk, "max_domains", config.mBulk.mMaxDomains );
            if ( config.mBulk.mThreads == 0 )
                throw ConfigError( "bulk.threads must be greater than 0" );
        }
        if ( top[ "log" ] ) {
            config.mLogLevel = loadParameter<std::string>( top[ "log" ], "level", config.mLogLevel );
            try {
                logger::toLevel( config.mLogLevel );
            }
            catch ( std::runtime_error &e ) {
                throw ConfigError( e.what() );
            }
        }
        if ( top[ "trust_anchors" ] ) {
            config.mTrustAnchors = loadTrustAnchors( top[ "trust_anchors" ] );
        }

        return config;
    }

    Config loadConfigFile( const std::string &filename )
    {
        std::ifstream                  fs( filename );
        std::istreambuf_iterator<char> begin( fs );
        std::istreambuf_iterator<char> end;

        if ( !fs ) {
            throw ConfigError( "cannot load config file \"" + filename + "\"" );
        }
        std::string config( begin, end );
        return loadConfig( config );
    }
}
