#include "dsmatcher.hpp"
#include "signatureverifier.hpp"
#include "zonefixture.hpp"
#include "gtest/gtest.h"
#include <cstring>
#include <iostream>

class DNSKEYTest : public ::testing::Test
{

public:
    std::shared_ptr<dnssec::RecordDNSKEY> mKey;
    dnssec::Domainname                    mOwner;

    virtual void SetUp()
    {
        // RFC 4034 5.4
        const char *public_key_base64 = "AQOeiiR0GOMYkDshWoSKz9XzfwJr1AYtsmx3TGkJaNXVbfi/"
                                        "2pHm822aJ5iI9BMzNXxeYCmZDRD99WYwYqUSdjMmmAphXdvx"
                                        "egXd/M5+X7OrzKBaMbCVdFLUUh6DhweJBjEVv5f2wwjM9Xzc"
                                        "nOf+EPbtG9DMBmADjFDc2w/rljwvFw==";
        std::vector<uint8_t> public_key;
        dnssec::decodeFromBase64( public_key_base64, public_key );

        mOwner = dnssec::Domainname( "dskey.example.com" );
        mKey   = std::make_shared<dnssec::RecordDNSKEY>( 256, dnssec::DNSSEC_RSASHA1, public_key );
    }

    virtual void TearDown()
    {
    }
};

TEST_F( DNSKEYTest, KeyTag )
{
    EXPECT_EQ( 60485, mKey->getKeyTag() );
    EXPECT_TRUE( mKey->isZoneKey() );
    EXPECT_FALSE( mKey->isSEP() );
    EXPECT_FALSE( mKey->isRevoked() );
}

TEST_F( DNSKEYTest, SHA1Digest )
{
    std::shared_ptr<dnssec::RecordDS> ds = dnssec::generateDSRecord( mOwner, *mKey, dnssec::DIGEST_SHA1 );

    std::string digest;
    dnssec::encodeToHex( ds->getDigest(), digest );

    EXPECT_EQ( 60485, ds->getKeyTag() );
    EXPECT_EQ( dnssec::DNSSEC_RSASHA1, ds->getAlgorithm() );
    EXPECT_EQ( "2BB183AF5F22588179A53B0A98631FAD1A292118", digest );
}

TEST_F( DNSKEYTest, DigestIgnoresOwnerCase )
{
    EXPECT_EQ( dnssec::computeDSDigest( mOwner, *mKey, dnssec::DIGEST_SHA256 ),
               dnssec::computeDSDigest( dnssec::Domainname( "DSKEY.Example.COM" ), *mKey, dnssec::DIGEST_SHA256 ) );
}

TEST_F( DNSKEYTest, DigestSize )
{
    EXPECT_EQ( 32, dnssec::computeDSDigest( mOwner, *mKey, dnssec::DIGEST_SHA256 ).size() );
    EXPECT_EQ( 48, dnssec::computeDSDigest( mOwner, *mKey, dnssec::DIGEST_SHA384 ).size() );
    EXPECT_THROW( dnssec::computeDSDigest( mOwner, *mKey, dnssec::DIGEST_GOST ), dnssec::CryptoError );
}

TEST_F( DNSKEYTest, RevokedKeyIsNotCandidate )
{
    dnssec::RecordDNSKEY revoked( 256 | dnssec::RecordDNSKEY::REVOKE, dnssec::DNSSEC_RSASHA1, mKey->getPublicKey() );
    dnssec::RecordDNSKEY not_zone_key( 0, dnssec::DNSSEC_RSASHA1, mKey->getPublicKey() );
    dnssec::RecordDNSKEY bad_protocol( 256, dnssec::DNSSEC_RSASHA1, mKey->getPublicKey(), 2 );

    EXPECT_TRUE( dnssec::isCandidateKey( *mKey ) );
    EXPECT_FALSE( dnssec::isCandidateKey( revoked ) );
    EXPECT_FALSE( dnssec::isCandidateKey( not_zone_key ) );
    EXPECT_FALSE( dnssec::isCandidateKey( bad_protocol ) );
}

TEST_F( DNSKEYTest, ZoneText )
{
    EXPECT_EQ( 0u, mKey->toZone().find( "256 3 5 AQOeiiR0" ) );
}

class DSMatcherTest : public ::testing::Test
{

public:
    dnssec::Domainname                                 mOwner;
    std::vector<std::shared_ptr<dnssec::RecordDNSKEY>> mKeys;
    std::shared_ptr<dnssec::ZoneKey>                   mKSK;
    std::shared_ptr<dnssec::ZoneKey>                   mZSK;

    virtual void SetUp()
    {
        mOwner = dnssec::Domainname( "example.com" );
        mKSK.reset( new dnssec::ZoneKey( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::KSK ) );
        mZSK.reset( new dnssec::ZoneKey( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::ZSK ) );
        mKeys.push_back( mKSK->getDNSKEY() );
        mKeys.push_back( mZSK->getDNSKEY() );
    }

    virtual void TearDown()
    {
    }
};

TEST_F( DSMatcherTest, Matched )
{
    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    ds_records.push_back( dnssec::generateDSRecord( mOwner, *mKSK->getDNSKEY(), dnssec::DIGEST_SHA256 ) );

    dnssec::DSMatchResult result = dnssec::matchDS( mOwner, mKeys, ds_records );

    ASSERT_TRUE( result.isMatched() );
    ASSERT_EQ( 1, result.getMatchedKeys().size() );
    EXPECT_EQ( mKSK->getDNSKEY(), result.getMatchedKeys()[ 0 ] );
}

TEST_F( DSMatcherTest, TwoDigestsOfOneKey )
{
    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    ds_records.push_back( dnssec::generateDSRecord( mOwner, *mKSK->getDNSKEY(), dnssec::DIGEST_SHA256 ) );
    ds_records.push_back( dnssec::generateDSRecord( mOwner, *mKSK->getDNSKEY(), dnssec::DIGEST_SHA384 ) );

    dnssec::DSMatchResult result = dnssec::matchDS( mOwner, mKeys, ds_records );

    ASSERT_TRUE( result.isMatched() );
    EXPECT_EQ( 2, result.mMatches.size() );
    EXPECT_EQ( 1, result.getMatchedKeys().size() ) << "matched keys have no duplicates";
}

TEST_F( DSMatcherTest, DigestMismatch )
{
    std::shared_ptr<dnssec::RecordDS> ds = dnssec::generateDSRecord( mOwner, *mKSK->getDNSKEY(), dnssec::DIGEST_SHA256 );
    std::vector<uint8_t>              digest = ds->getDigest();
    digest[ 0 ] ^= 0x01;

    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    ds_records.push_back(
        std::make_shared<dnssec::RecordDS>( ds->getKeyTag(), ds->getAlgorithm(), ds->getDigestType(), digest ) );

    dnssec::DSMatchResult result = dnssec::matchDS( mOwner, mKeys, ds_records );

    EXPECT_FALSE( result.isMatched() );
    EXPECT_EQ( dnssec::DS_DIGEST_MISMATCH, result.mStatus );
}

TEST_F( DSMatcherTest, DigestOfOtherOwner )
{
    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    ds_records.push_back(
        dnssec::generateDSRecord( dnssec::Domainname( "example.net" ), *mKSK->getDNSKEY(), dnssec::DIGEST_SHA256 ) );

    EXPECT_EQ( dnssec::DS_DIGEST_MISMATCH, dnssec::matchDS( mOwner, mKeys, ds_records ).mStatus );
}

TEST_F( DSMatcherTest, UnsupportedDigestOnly )
{
    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    ds_records.push_back( std::make_shared<dnssec::RecordDS>(
        mKSK->getKeyTag(), dnssec::DNSSEC_ECDSAP256SHA256, dnssec::DIGEST_GOST, std::vector<uint8_t>( 32, 0 ) ) );

    EXPECT_EQ( dnssec::DS_NO_SUPPORTED_DIGEST, dnssec::matchDS( mOwner, mKeys, ds_records ).mStatus );
}

TEST_F( DSMatcherTest, NoCandidate )
{
    std::vector<std::shared_ptr<dnssec::RecordDS>> ds_records;
    EXPECT_EQ( dnssec::DS_NO_CANDIDATE, dnssec::matchDS( mOwner, mKeys, ds_records ).mStatus );

    ds_records.push_back( std::make_shared<dnssec::RecordDS>( static_cast<uint16_t>( mKSK->getKeyTag() + 1 ),
                                                              dnssec::DNSSEC_ECDSAP256SHA256,
                                                              dnssec::DIGEST_SHA256,
                                                              std::vector<uint8_t>( 32, 0 ) ) );
    if ( ds_records[ 0 ]->getKeyTag() != mZSK->getKeyTag() )
        EXPECT_EQ( dnssec::DS_NO_CANDIDATE, dnssec::matchDS( mOwner, mKeys, ds_records ).mStatus );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
