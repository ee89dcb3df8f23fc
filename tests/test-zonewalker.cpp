#include "zonewalker.hpp"
#include "dsmatcher.hpp"
#include "zonefixture.hpp"
#include "gtest/gtest.h"
#include <cstring>
#include <iostream>

const uint32_t NOW = 1700000000;

class ZoneWalkerTest : public ::testing::Test
{

public:
    std::unique_ptr<dnssec::SignedHierarchy> mHierarchy;

    virtual void SetUp()
    {
        mHierarchy.reset( new dnssec::SignedHierarchy( NOW ) );
        mHierarchy->addSignedZone( "." );
        mHierarchy->addSignedZone( "dk" );
        mHierarchy->addSignedZone( "bondit.dk" );
        mHierarchy->addUnsignedZone( "insecure.dk" );
    }

    virtual void TearDown()
    {
    }

    dnssec::WalkResult walk( const dnssec::Domainname &domain, unsigned int deadline_msec = 5000 )
    {
        return walkWithAnchors( domain, mHierarchy->getTrustAnchors(), deadline_msec );
    }

    dnssec::WalkResult
    walkWithAnchors( const dnssec::Domainname &domain, dnssec::TrustAnchorSetPtr anchors, unsigned int deadline_msec = 5000 )
    {
        dnssec::Deadline      deadline( deadline_msec );
        dnssec::RecordFetcher fetcher( mHierarchy->getTransport(), 2, deadline );
        dnssec::ZoneWalker    walker( fetcher, anchors, NOW );
        return walker.walk( domain );
    }
};

TEST_F( ZoneWalkerTest, ValidChain )
{
    dnssec::WalkResult result = walk( "bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::Domainname( "." ), result.mChain[ 0 ].mZone );
    EXPECT_EQ( dnssec::Domainname( "dk" ), result.mChain[ 1 ].mZone );
    EXPECT_EQ( dnssec::Domainname( "bondit.dk" ), result.mChain[ 2 ].mZone );
    for ( auto &link : result.mChain ) {
        EXPECT_EQ( dnssec::STATUS_VALID, link.mStatus ) << link.mZone;
        EXPECT_FALSE( link.mError );
        ASSERT_TRUE( link.mAlgorithm );
        EXPECT_EQ( dnssec::DNSSEC_ECDSAP256SHA256, *link.mAlgorithm );
    }
    EXPECT_EQ( mHierarchy->getZone( "bondit.dk" ).mKSK->getKeyTag(), *result.mChain[ 2 ].mKeyTag );
    EXPECT_EQ( dnssec::STATUS_VALID, result.getStatus() );
    EXPECT_TRUE( result.mErrors.empty() );
    EXPECT_TRUE( result.findValidatedKeys( "bondit.dk" ) != nullptr );
}

TEST_F( ZoneWalkerTest, CollectsRecords )
{
    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( 6, result.mRecords.mDNSKEY.size() );
    EXPECT_EQ( 2, result.mRecords.mDS.size() );
    EXPECT_EQ( 5, result.mRecords.mRRSIG.size() );
    EXPECT_EQ( "bondit.dk.", result.mRecords.mDS[ 1 ].mZone );
}

TEST_F( ZoneWalkerTest, NameBelowZoneCutIsSkipped )
{
    dnssec::WalkResult result = walk( "www.bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::Domainname( "bondit.dk" ), result.mChain.back().mZone );
    EXPECT_EQ( dnssec::STATUS_VALID, result.getStatus() );
}

TEST_F( ZoneWalkerTest, NXDomain )
{
    mHierarchy->getTransport().setMode( "nx.bondit.dk", dnssec::TYPE_DNSKEY, dnssec::MockAnswer::NXDOMAIN_ANSWER );

    dnssec::WalkResult result = walk( "nx.bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_VALID, result.mChain.back().mStatus );
    EXPECT_FALSE( result.mDomainExists );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.getStatus() );
    ASSERT_EQ( 1, result.mErrors.size() );
    EXPECT_EQ( "nx.bondit.dk.: domain does not exist", result.mErrors[ 0 ] );
}

TEST_F( ZoneWalkerTest, NXDomainAboveDomain )
{
    mHierarchy->getTransport().setMode( "nx.bondit.dk", dnssec::TYPE_DNSKEY, dnssec::MockAnswer::NXDOMAIN_ANSWER );
    unsigned int queries = mHierarchy->getTransport().getQueryCount();

    dnssec::WalkResult result = walk( "www.nx.bondit.dk" );

    EXPECT_FALSE( result.mDomainExists );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.getStatus() );
    ASSERT_EQ( 1, result.mErrors.size() );
    EXPECT_EQ( 0u, result.mErrors[ 0 ].find( "www.nx.bondit.dk.: domain does not exist" ) );
    EXPECT_EQ( 0, mHierarchy->getTransport().getQueryCount( "www.nx.bondit.dk", dnssec::TYPE_DNSKEY ) )
        << "walk stops at the nonexistent name";
    EXPECT_LT( queries, mHierarchy->getTransport().getQueryCount() );
}

TEST_F( ZoneWalkerTest, InsecureDelegation )
{
    dnssec::WalkResult result = walk( "www.insecure.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::Domainname( "insecure.dk" ), result.mChain[ 2 ].mZone );
    EXPECT_EQ( dnssec::STATUS_INSECURE, result.mChain[ 2 ].mStatus );
    EXPECT_TRUE( result.mChain[ 2 ].mError );
    EXPECT_EQ( dnssec::STATUS_INSECURE, result.getStatus() );
    EXPECT_TRUE( result.mErrors.empty() );
}

TEST_F( ZoneWalkerTest, CorruptedDNSKEYSignature )
{
    dnssec::MockAnswer &answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DNSKEY );
    answer.mRRSIGs[ 0 ]        = dnssec::corruptRRSIG( *answer.mRRSIGs[ 0 ] );

    dnssec::WalkResult result = walk( "www.bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_VALID, result.mChain[ 1 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain[ 2 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.getStatus() );
    ASSERT_EQ( 1, result.mErrors.size() );
    EXPECT_EQ( 0u, result.mErrors[ 0 ].find( "bondit.dk." ) );
    EXPECT_TRUE( result.findValidatedKeys( "bondit.dk" ) == nullptr );
}

TEST_F( ZoneWalkerTest, DSDigestMismatch )
{
    dnssec::MockAnswer &answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DS );
    auto                ds     = dnssec::castRRSet<dnssec::RecordDS>( answer.mRRSet )[ 0 ];
    std::vector<uint8_t> digest = ds->getDigest();
    digest[ 0 ] ^= 0xff;

    dnssec::RRSet bad_ds( "bondit.dk", dnssec::CLASS_IN, dnssec::TYPE_DS, 86400 );
    bad_ds.add( std::make_shared<dnssec::RecordDS>( ds->getKeyTag(), ds->getAlgorithm(), ds->getDigestType(), digest ) );
    dnssec::SignedHierarchy::Zone &dk = mHierarchy->getZone( "dk" );
    mHierarchy->getTransport().setAnswer(
        bad_ds, { dnssec::signRRSet( bad_ds, *dk.mZSK, "dk", mHierarchy->getInception(), mHierarchy->getExpiration() ) } );

    dnssec::WalkResult result = walk( "bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain[ 2 ].mStatus );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.getStatus() );
}

TEST_F( ZoneWalkerTest, CorruptedDSSignature )
{
    dnssec::MockAnswer &answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DS );
    answer.mRRSIGs[ 0 ]        = dnssec::corruptRRSIG( *answer.mRRSIGs[ 0 ] );

    dnssec::WalkResult result = walk( "bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain[ 2 ].mStatus );
    EXPECT_NE( std::string::npos, result.mChain[ 2 ].mError->find( "DS RRset" ) );
}

TEST_F( ZoneWalkerTest, UnsignedDS )
{
    mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DS ).mRRSIGs.clear();

    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( dnssec::STATUS_BOGUS, result.getStatus() );
}

TEST_F( ZoneWalkerTest, DSWithoutDNSKEY )
{
    mHierarchy->getTransport().removeAnswer( "bondit.dk", dnssec::TYPE_DNSKEY );

    dnssec::WalkResult result = walk( "bondit.dk" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain[ 2 ].mStatus );
}

TEST_F( ZoneWalkerTest, ExpiredDNSKEYSignature )
{
    mHierarchy->resignDNSKEY( "bondit.dk", NOW - 7200, NOW - 3600 );

    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain.back().mStatus );
}

TEST_F( ZoneWalkerTest, UpstreamTimeout )
{
    mHierarchy->getTransport().setMode( ".", dnssec::TYPE_DNSKEY, dnssec::MockAnswer::TIMEOUT );

    dnssec::WalkResult result = walk( "www.bondit.dk" );

    ASSERT_EQ( 1, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.mChain[ 0 ].mStatus );
    EXPECT_NE( std::string::npos, result.mChain[ 0 ].mError->find( "NetworkError" ) );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.getStatus() );
    EXPECT_EQ( 1, result.mErrors.size() );
}

TEST_F( ZoneWalkerTest, TransientTimeoutIsRecovered )
{
    mHierarchy->getTransport().setMode( "dk", dnssec::TYPE_DS, dnssec::MockAnswer::TIMEOUT, 1 );

    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( dnssec::STATUS_VALID, result.getStatus() );
    EXPECT_EQ( 2, mHierarchy->getTransport().getQueryCount( "dk", dnssec::TYPE_DS ) );
}

TEST_F( ZoneWalkerTest, ServFail )
{
    mHierarchy->getTransport().setMode( "dk", dnssec::TYPE_DNSKEY, dnssec::MockAnswer::SERVFAIL_ANSWER );

    dnssec::WalkResult result = walk( "bondit.dk" );

    ASSERT_EQ( 2, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.mChain[ 1 ].mStatus );
    EXPECT_NE( std::string::npos, result.mChain[ 1 ].mError->find( "ProtocolError" ) );
}

TEST_F( ZoneWalkerTest, DeadlineExceeded )
{
    dnssec::WalkResult result = walk( "bondit.dk", 0 );

    ASSERT_EQ( 1, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.mChain[ 0 ].mStatus );
    EXPECT_NE( std::string::npos, result.mChain[ 0 ].mError->find( "deadline" ) );
    EXPECT_EQ( 0, mHierarchy->getTransport().getQueryCount() );
}

TEST_F( ZoneWalkerTest, UnsupportedAlgorithm )
{
    dnssec::SignedHierarchy::Zone &zone   = mHierarchy->getZone( "bondit.dk" );
    dnssec::MockAnswer &           answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DNSKEY );
    answer.mRRSIGs[ 0 ] = std::make_shared<dnssec::RecordRRSIG>( dnssec::TYPE_DNSKEY,
                                                                 dnssec::DNSSEC_ECC_GOST,
                                                                 2,
                                                                 3600,
                                                                 mHierarchy->getExpiration(),
                                                                 mHierarchy->getInception(),
                                                                 zone.mKSK->getKeyTag(),
                                                                 "bondit.dk",
                                                                 std::vector<uint8_t>( 64, 0 ) );

    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.mChain.back().mStatus );
    EXPECT_EQ( dnssec::STATUS_INDETERMINATE, result.getStatus() );
}

TEST_F( ZoneWalkerTest, JunkSignatureDoesNotHideForgery )
{
    dnssec::SignedHierarchy::Zone &zone   = mHierarchy->getZone( "bondit.dk" );
    dnssec::MockAnswer &           answer = mHierarchy->getTransport().getAnswer( "bondit.dk", dnssec::TYPE_DNSKEY );
    answer.mRRSIGs[ 0 ]                   = dnssec::corruptRRSIG( *answer.mRRSIGs[ 0 ] );
    answer.mRRSIGs.push_back( std::make_shared<dnssec::RecordRRSIG>( dnssec::TYPE_DNSKEY,
                                                                     200,
                                                                     2,
                                                                     3600,
                                                                     mHierarchy->getExpiration(),
                                                                     mHierarchy->getInception(),
                                                                     zone.mKSK->getKeyTag(),
                                                                     "bondit.dk",
                                                                     std::vector<uint8_t>( 64, 0 ) ) );

    dnssec::WalkResult result = walk( "bondit.dk" );

    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain.back().mStatus );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.getStatus() );
}

TEST_F( ZoneWalkerTest, DNSKEYTrustAnchor )
{
    dnssec::TrustAnchor anchor;
    anchor.mZone   = dnssec::Domainname( "." );
    anchor.mDNSKEY = mHierarchy->getZone( "." ).mKSK->getDNSKEY();
    auto anchors   = std::make_shared<dnssec::TrustAnchorSet>( "dnskey", std::vector<dnssec::TrustAnchor>{ anchor } );

    dnssec::WalkResult result = walkWithAnchors( "bondit.dk", anchors );

    EXPECT_EQ( dnssec::STATUS_VALID, result.getStatus() );
}

TEST_F( ZoneWalkerTest, UnknownTrustAnchor )
{
    dnssec::ZoneKey     other( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::KSK );
    dnssec::TrustAnchor anchor;
    anchor.mZone = dnssec::Domainname( "." );
    anchor.mDS   = dnssec::generateDSRecord( ".", *other.getDNSKEY(), dnssec::DIGEST_SHA256 );
    auto anchors = std::make_shared<dnssec::TrustAnchorSet>( "other", std::vector<dnssec::TrustAnchor>{ anchor } );

    dnssec::WalkResult result = walkWithAnchors( "bondit.dk", anchors );

    ASSERT_EQ( 1, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_BOGUS, result.mChain[ 0 ].mStatus );
    EXPECT_NE( std::string::npos, result.mChain[ 0 ].mError->find( "other" ) );
}

TEST_F( ZoneWalkerTest, KeyRolloverAnchors )
{
    dnssec::ZoneKey     other( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::KSK );
    dnssec::TrustAnchor old_anchor, new_anchor;
    old_anchor.mZone = dnssec::Domainname( "." );
    old_anchor.mDS   = dnssec::generateDSRecord( ".", *other.getDNSKEY(), dnssec::DIGEST_SHA256 );
    new_anchor       = mHierarchy->getTrustAnchors()->getAnchors()[ 0 ];
    auto anchors     = std::make_shared<dnssec::TrustAnchorSet>( "rollover",
                                                             std::vector<dnssec::TrustAnchor>{ old_anchor, new_anchor } );

    EXPECT_EQ( dnssec::STATUS_VALID, walkWithAnchors( "bondit.dk", anchors ).getStatus() );
}

TEST_F( ZoneWalkerTest, RSAHierarchy )
{
    mHierarchy.reset( new dnssec::SignedHierarchy( NOW, dnssec::DNSSEC_RSASHA256 ) );
    mHierarchy->addSignedZone( "." );
    mHierarchy->addSignedZone( "com" );
    mHierarchy->addSignedZone( "example.com", dnssec::DNSSEC_ED25519 );

    dnssec::WalkResult result = walk( "www.example.com" );

    ASSERT_EQ( 3, result.mChain.size() );
    EXPECT_EQ( dnssec::STATUS_VALID, result.getStatus() );
    EXPECT_EQ( dnssec::DNSSEC_RSASHA256, *result.mChain[ 1 ].mAlgorithm );
    EXPECT_EQ( dnssec::DNSSEC_ED25519, *result.mChain[ 2 ].mAlgorithm );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
