#include "signatureverifier.hpp"
#include "zonefixture.hpp"
#include "gtest/gtest.h"
#include <cstring>
#include <iostream>

const uint32_t NOW = 1700000000;

class SignatureVerifierTest : public ::testing::Test
{

public:
    dnssec::Domainname                                 mZone;
    std::shared_ptr<dnssec::ZoneKey>                   mZSK;
    std::vector<std::shared_ptr<dnssec::RecordDNSKEY>> mKeys;
    dnssec::SignatureVerifier                          mVerifier;

    virtual void SetUp()
    {
        mZone = dnssec::Domainname( "example.com" );
        mZSK.reset( new dnssec::ZoneKey( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::ZSK ) );
        mKeys.push_back( mZSK->getDNSKEY() );
    }

    virtual void TearDown()
    {
    }

    static dnssec::RRSet createARRSet( const dnssec::Domainname &owner )
    {
        dnssec::RRSet rrset( owner, dnssec::CLASS_IN, dnssec::TYPE_A, 300 );
        rrset.add( std::make_shared<dnssec::RecordRaw>( dnssec::TYPE_A, std::vector<uint8_t>{ 192, 0, 2, 1 } ) );
        rrset.add( std::make_shared<dnssec::RecordRaw>( dnssec::TYPE_A, std::vector<uint8_t>{ 192, 0, 2, 2 } ) );
        return rrset;
    }

    std::shared_ptr<dnssec::RecordRRSIG> sign( const dnssec::RRSet &rrset )
    {
        return dnssec::signRRSet( rrset, *mZSK, mZone, NOW - 3600, NOW + 3600 );
    }
};

TEST_F( SignatureVerifierTest, Valid )
{
    dnssec::RRSet        rrset  = createARRSet( "www.example.com" );
    dnssec::VerifyResult result = mVerifier.verify( rrset, { sign( rrset ) }, mKeys, mZone, NOW );

    EXPECT_TRUE( result.isValid() ) << result.mMessage;
    EXPECT_EQ( mZSK->getDNSKEY(), result.mKey );
}

TEST_F( SignatureVerifierTest, SupportedAlgorithms )
{
    std::vector<dnssec::SignAlgorithm> algorithms = {
        dnssec::DNSSEC_RSASHA1,         dnssec::DNSSEC_RSASHA256,       dnssec::DNSSEC_RSASHA512,
        dnssec::DNSSEC_ECDSAP256SHA256, dnssec::DNSSEC_ECDSAP384SHA384, dnssec::DNSSEC_ED25519,
        dnssec::DNSSEC_ED448,
    };
    dnssec::RRSet rrset = createARRSet( "www.example.com" );

    for ( auto algo : algorithms ) {
        dnssec::ZoneKey                                    key( algo, dnssec::RecordDNSKEY::ZSK );
        std::vector<std::shared_ptr<dnssec::RecordDNSKEY>> keys   = { key.getDNSKEY() };
        auto                                               rrsig  = dnssec::signRRSet( rrset, key, mZone, NOW - 60, NOW + 60 );
        dnssec::VerifyResult                               result = mVerifier.verify( rrset, { rrsig }, keys, mZone, NOW );

        EXPECT_TRUE( result.isValid() ) << dnssec::signAlgorithmToString( algo ) << ": " << result.mMessage;
        EXPECT_TRUE( dnssec::createAlgorithmVerifier( algo )->isSupported() );

        auto corrupted = dnssec::corruptRRSIG( *rrsig );
        EXPECT_EQ( dnssec::VERIFY_CRYPTO_FAILURE, mVerifier.verify( rrset, { corrupted }, keys, mZone, NOW ).mStatus )
            << dnssec::signAlgorithmToString( algo );
    }
}

TEST_F( SignatureVerifierTest, RecordOrderAndOwnerCase )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    dnssec::RRSet reordered( "WWW.Example.COM", dnssec::CLASS_IN, dnssec::TYPE_A, 300 );
    reordered.add( rrset[ 1 ] );
    reordered.add( rrset[ 0 ] );

    EXPECT_TRUE( mVerifier.verify( reordered, { rrsig }, mKeys, mZone, NOW ).isValid() );
}

TEST_F( SignatureVerifierTest, ModifiedRRSet )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );
    rrset.add( std::make_shared<dnssec::RecordRaw>( dnssec::TYPE_A, std::vector<uint8_t>{ 192, 0, 2, 3 } ) );

    EXPECT_EQ( dnssec::VERIFY_CRYPTO_FAILURE, mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW ).mStatus );
}

TEST_F( SignatureVerifierTest, CorruptedSignature )
{
    dnssec::RRSet        rrset  = createARRSet( "www.example.com" );
    dnssec::VerifyResult result = mVerifier.verify( rrset, { dnssec::corruptRRSIG( *sign( rrset ) ) }, mKeys, mZone, NOW );

    EXPECT_EQ( dnssec::VERIFY_CRYPTO_FAILURE, result.mStatus );
    EXPECT_FALSE( result.isIndeterminate() );
}

TEST_F( SignatureVerifierTest, AnyValidSignature )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    EXPECT_TRUE( mVerifier.verify( rrset, { dnssec::corruptRRSIG( *rrsig ), rrsig }, mKeys, mZone, NOW ).isValid() );
}

TEST_F( SignatureVerifierTest, NoSignature )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );

    EXPECT_EQ( dnssec::VERIFY_NO_SIGNATURE, mVerifier.verify( rrset, {}, mKeys, mZone, NOW ).mStatus );
}

TEST_F( SignatureVerifierTest, Expired )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    EXPECT_EQ( dnssec::VERIFY_OUTSIDE_VALIDITY_PERIOD,
               mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW + 7200 ).mStatus );
    EXPECT_EQ( dnssec::VERIFY_OUTSIDE_VALIDITY_PERIOD,
               mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW - 7200 ).mStatus );
    EXPECT_TRUE( mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW + 3600 ).isValid() ) << "expiration is inclusive";
}

TEST_F( SignatureVerifierTest, SerialNumberArithmetic )
{
    EXPECT_TRUE( dnssec::serialLessThan( 1, 2 ) );
    EXPECT_FALSE( dnssec::serialLessThan( 2, 1 ) );
    EXPECT_FALSE( dnssec::serialLessThan( 5, 5 ) );
    EXPECT_TRUE( dnssec::serialLessThan( 0xffffff00, 0x00000100 ) ) << "wraps around 2^32";

    dnssec::RecordRRSIG wrapped(
        dnssec::TYPE_A, dnssec::DNSSEC_ECDSAP256SHA256, 3, 300, 0x00000100, 0xffffff00, 1, mZone, std::vector<uint8_t>() );
    EXPECT_TRUE( dnssec::isInValidityPeriod( wrapped, 0x00000010 ) );
    EXPECT_TRUE( dnssec::isInValidityPeriod( wrapped, 0xfffffff0 ) );
    EXPECT_FALSE( dnssec::isInValidityPeriod( wrapped, 0x00000200 ) );
}

TEST_F( SignatureVerifierTest, WrongSigner )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = dnssec::signRRSet( rrset, *mZSK, "example.net", NOW - 60, NOW + 60 );

    EXPECT_EQ( dnssec::VERIFY_INVALID_RRSIG, mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW ).mStatus );
}

TEST_F( SignatureVerifierTest, NoMatchingKey )
{
    dnssec::RRSet   rrset = createARRSet( "www.example.com" );
    dnssec::ZoneKey other( dnssec::DNSSEC_ECDSAP256SHA256, dnssec::RecordDNSKEY::ZSK );
    auto            rrsig = dnssec::signRRSet( rrset, other, mZone, NOW - 60, NOW + 60 );

    if ( other.getKeyTag() != mZSK->getKeyTag() )
        EXPECT_EQ( dnssec::VERIFY_NO_KEY, mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW ).mStatus );
}

TEST_F( SignatureVerifierTest, RevokedKey )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    std::vector<std::shared_ptr<dnssec::RecordDNSKEY>> keys = { std::make_shared<dnssec::RecordDNSKEY>(
        dnssec::RecordDNSKEY::ZSK | dnssec::RecordDNSKEY::REVOKE, dnssec::DNSSEC_ECDSAP256SHA256, mZSK->getDNSKEY()->getPublicKey() ) };

    EXPECT_FALSE( mVerifier.verify( rrset, { rrsig }, keys, mZone, NOW ).isValid() );
}

TEST_F( SignatureVerifierTest, UnsupportedAlgorithm )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = std::make_shared<dnssec::RecordRRSIG>(
        dnssec::TYPE_A, dnssec::DNSSEC_ECC_GOST, 3, 300, NOW + 60, NOW - 60, 1, mZone, std::vector<uint8_t>( 64, 0 ) );

    dnssec::VerifyResult result = mVerifier.verify( rrset, { rrsig }, mKeys, mZone, NOW );
    EXPECT_EQ( dnssec::VERIFY_UNSUPPORTED_ALGORITHM, result.mStatus );
    EXPECT_TRUE( result.isIndeterminate() );
    EXPECT_FALSE( dnssec::createAlgorithmVerifier( dnssec::DNSSEC_ECC_GOST )->isSupported() );
    EXPECT_FALSE( dnssec::createAlgorithmVerifier( 200 )->isSupported() );
}

TEST_F( SignatureVerifierTest, UnsupportedAlgorithmDoesNotHideFailure )
{
    dnssec::RRSet rrset   = createARRSet( "www.example.com" );
    auto          unknown = std::make_shared<dnssec::RecordRRSIG>(
        dnssec::TYPE_A, 200, 3, 300, NOW + 60, NOW - 60, mZSK->getKeyTag(), mZone, std::vector<uint8_t>( 64, 0 ) );
    auto corrupted = dnssec::corruptRRSIG( *sign( rrset ) );

    dnssec::VerifyResult result = mVerifier.verify( rrset, { corrupted, unknown }, mKeys, mZone, NOW );
    EXPECT_EQ( dnssec::VERIFY_CRYPTO_FAILURE, result.mStatus );
    EXPECT_FALSE( result.isIndeterminate() );

    result = mVerifier.verify( rrset, { unknown, corrupted }, mKeys, mZone, NOW );
    EXPECT_EQ( dnssec::VERIFY_CRYPTO_FAILURE, result.mStatus ) << "RRSIG order does not matter";

    auto expired = dnssec::signRRSet( rrset, *mZSK, mZone, NOW - 7200, NOW - 3600 );
    EXPECT_EQ( dnssec::VERIFY_OUTSIDE_VALIDITY_PERIOD,
               mVerifier.verify( rrset, { unknown, expired }, mKeys, mZone, NOW ).mStatus );

    auto unknown_key = std::make_shared<dnssec::RecordRRSIG>( dnssec::TYPE_A,
                                                              dnssec::DNSSEC_ECDSAP256SHA256,
                                                              3,
                                                              300,
                                                              NOW + 60,
                                                              NOW - 60,
                                                              mZSK->getKeyTag() + 1,
                                                              mZone,
                                                              std::vector<uint8_t>( 64, 0 ) );
    EXPECT_EQ( dnssec::VERIFY_NO_KEY, mVerifier.verify( rrset, { unknown, unknown_key }, mKeys, mZone, NOW ).mStatus );

    EXPECT_TRUE( mVerifier.verify( rrset, { unknown, sign( rrset ) }, mKeys, mZone, NOW ).isValid() );
}

TEST_F( SignatureVerifierTest, WildcardExpansion )
{
    dnssec::RRSet wildcard = createARRSet( "*.example.com" );
    auto          rrsig    = sign( wildcard );
    EXPECT_EQ( 2, rrsig->getLabelCount() );

    dnssec::RRSet expanded( "www.example.com", dnssec::CLASS_IN, dnssec::TYPE_A, 300 );
    for ( auto rdata : wildcard )
        expanded.add( rdata );

    EXPECT_TRUE( mVerifier.verify( expanded, { rrsig }, mKeys, mZone, NOW ).isValid() );
}

TEST_F( SignatureVerifierTest, LabelsExceedOwner )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    dnssec::RRSet shorter( "example.com", dnssec::CLASS_IN, dnssec::TYPE_A, 300 );
    for ( auto rdata : rrset )
        shorter.add( rdata );

    EXPECT_EQ( dnssec::VERIFY_INVALID_RRSIG, mVerifier.verify( shorter, { rrsig }, mKeys, mZone, NOW ).mStatus );
}

TEST_F( SignatureVerifierTest, MalformedPublicKey )
{
    dnssec::RRSet rrset = createARRSet( "www.example.com" );
    auto          rrsig = sign( rrset );

    for ( auto algo : { dnssec::DNSSEC_RSASHA256, dnssec::DNSSEC_ECDSAP256SHA256, dnssec::DNSSEC_ED25519 } ) {
        EXPECT_FALSE( dnssec::createAlgorithmVerifier( algo )->verify(
            std::vector<uint8_t>( 3, 0 ), std::vector<uint8_t>( 16, 0 ), rrsig->getSignature() ) )
            << dnssec::signAlgorithmToString( algo );
    }
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
