#include "dns.hpp"
#include <arpa/inet.h>
#include <boost/lexical_cast.hpp>
#include <ctime>
#include <sstream>

namespace dnssec
{
    typedef std::pair<QuestionSectionEntry, const uint8_t *> QuestionSectionEntryPair;
    typedef std::pair<ResourceRecord, const uint8_t *>       ResourceRecordPair;

    static void generateQuestion( const QuestionSectionEntry &q, WireFormat &message );
    static void generateResourceRecord( const ResourceRecord &r, WireFormat &message );
    static QuestionSectionEntryPair parseQuestion( const uint8_t *begin, const uint8_t *end, const uint8_t *section );
    static ResourceRecordPair parseResourceRecord( const uint8_t *begin, const uint8_t *end, const uint8_t *section );

    static void checkRemain( const uint8_t *pos, const uint8_t *end, unsigned int need, const char *what )
    {
        if ( pos > end || static_cast<unsigned int>( end - pos ) < need ) {
            std::ostringstream os;
            os << "too short data for " << what;
            throw FormatError( os.str() );
        }
    }

    uint16_t QuestionSectionEntry::size() const
    {
        return mDomainname.size() + sizeof( mType ) + sizeof( mClass );
    }

    uint32_t ResourceRecord::size() const
    {
        return mDomainname.size() + sizeof( mType ) + sizeof( mClass ) + sizeof( mTTL ) +
               sizeof( uint16_t ) + // size of resource data size
               ( mRData ? mRData->size() : 0 );
    }

    void MessageInfo::generateMessage( WireFormat &message ) const
    {
        PacketHeaderField header;
        std::memset( &header, 0, sizeof( header ) );
        header.id                   = htons( mID );
        header.opcode               = mOpcode;
        header.query_response       = mQueryResponse;
        header.authoritative_answer = mAuthoritativeAnswer;
        header.truncation           = mTruncation;
        header.recursion_desired    = mRecursionDesired;
        header.recursion_available  = mRecursionAvailable;
        header.zero_field           = 0;
        header.authentic_data       = mAuthenticData;
        header.checking_disabled    = mCheckingDisabled;
        header.response_code        = mResponseCode;

        std::vector<ResourceRecord> additional = mAdditionalSection;
        if ( isEDNS0() ) {
            additional.push_back( generateOptPseudoRecord( mOptPseudoRR ) );
        }

        header.question_count              = htons( mQuestionSection.size() );
        header.answer_count                = htons( mAnswerSection.size() );
        header.authority_count             = htons( mAuthoritySection.size() );
        header.additional_infomation_count = htons( additional.size() );

        message.pushBuffer( reinterpret_cast<const uint8_t *>( &header ),
                            reinterpret_cast<const uint8_t *>( &header ) + sizeof( header ) );

        for ( auto &q : mQuestionSection ) {
            generateQuestion( q, message );
        }
        for ( auto &r : mAnswerSection ) {
            generateResourceRecord( r, message );
        }
        for ( auto &r : mAuthoritySection ) {
            generateResourceRecord( r, message );
        }
        for ( auto &r : additional ) {
            generateResourceRecord( r, message );
        }
    }

    uint32_t MessageInfo::getMessageSize() const
    {
        WireFormat output;
        generateMessage( output );
        return output.size();
    }

    MessageInfo parseDNSMessage( const uint8_t *begin, const uint8_t *end )
    {
        const uint8_t *packet = begin;

        if ( end < begin || static_cast<size_t>( end - begin ) < sizeof( PacketHeaderField ) ) {
            throw FormatError( "too short message size( less than DNS message header size )." );
        }

        MessageInfo       message;
        PacketHeaderField header;
        std::memcpy( &header, begin, sizeof( header ) );

        message.mID                  = ntohs( header.id );
        message.mQueryResponse       = header.query_response;
        message.mOpcode              = header.opcode;
        message.mAuthoritativeAnswer = header.authoritative_answer;
        message.mTruncation          = header.truncation;
        message.mRecursionAvailable  = header.recursion_available;
        message.mRecursionDesired    = header.recursion_desired;
        message.mZeroField           = header.zero_field;
        message.mCheckingDisabled    = header.checking_disabled;
        message.mAuthenticData       = header.authentic_data;
        message.mResponseCode        = header.response_code;

        int question_count   = ntohs( header.question_count );
        int answer_count     = ntohs( header.answer_count );
        int authority_count  = ntohs( header.authority_count );
        int additional_count = ntohs( header.additional_infomation_count );

        packet += sizeof( PacketHeaderField );
        for ( int i = 0; i < question_count; i++ ) {
            QuestionSectionEntryPair pair = parseQuestion( begin, end, packet );
            message.mQuestionSection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < answer_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            message.mAnswerSection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < authority_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            message.mAuthoritySection.push_back( pair.first );
            packet = pair.second;
        }
        for ( int i = 0; i < additional_count; i++ ) {
            ResourceRecordPair pair = parseResourceRecord( begin, end, packet );
            if ( pair.first.mType == TYPE_OPT ) {
                message.mIsEDNS0     = true;
                message.mOptPseudoRR = parseOPTPseudoRecord( pair.first );
                message.mResponseCode |= ( message.mOptPseudoRR.mRCode << 4 );
            } else {
                message.mAdditionalSection.push_back( pair.first );
            }
            packet = pair.second;
        }

        return message;
    }

    static void generateQuestion( const QuestionSectionEntry &question, WireFormat &message )
    {
        question.mDomainname.outputWireFormat( message );
        message.pushUInt16HtoN( question.mType );
        message.pushUInt16HtoN( question.mClass );
    }

    static QuestionSectionEntryPair parseQuestion( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *p )
    {
        QuestionSectionEntry question;
        const uint8_t *      pos = Domainname::parsePacket( question.mDomainname, packet_begin, packet_end, p );

        checkRemain( pos, packet_end, 4, "question section" );
        question.mType  = ntohs( get_bytes<uint16_t>( &pos ) );
        question.mClass = ntohs( get_bytes<uint16_t>( &pos ) );

        return QuestionSectionEntryPair( question, pos );
    }

    static void generateResourceRecord( const ResourceRecord &record, WireFormat &message )
    {
        record.mDomainname.outputWireFormat( message );
        message.pushUInt16HtoN( record.mType );
        message.pushUInt16HtoN( record.mClass );
        message.pushUInt32HtoN( record.mTTL );
        if ( record.mRData ) {
            message.pushUInt16HtoN( record.mRData->size() );
            record.mRData->outputWireFormat( message );
        } else {
            message.pushUInt16HtoN( 0 );
        }
    }

    static ResourceRecordPair parseResourceRecord( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *section_begin )
    {
        ResourceRecord record;

        const uint8_t *pos = Domainname::parsePacket( record.mDomainname, packet_begin, packet_end, section_begin );
        checkRemain( pos, packet_end, 10, "resource record" );
        record.mType         = ntohs( get_bytes<uint16_t>( &pos ) );
        record.mClass        = ntohs( get_bytes<uint16_t>( &pos ) );
        record.mTTL          = ntohl( get_bytes<uint32_t>( &pos ) );
        uint16_t data_length = ntohs( get_bytes<uint16_t>( &pos ) );
        checkRemain( pos, packet_end, data_length, "RDATA" );

        const uint8_t *rdata_end = pos + data_length;
        RDATAPtr       parsed_data;
        switch ( record.mType ) {
        case TYPE_SOA:
            parsed_data = RecordSOA::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        case TYPE_DNSKEY:
            parsed_data = RecordDNSKEY::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        case TYPE_DS:
            parsed_data = RecordDS::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        case TYPE_RRSIG:
            parsed_data = RecordRRSIG::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        case TYPE_TLSA:
            parsed_data = RecordTLSA::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        case TYPE_OPT:
            parsed_data = RecordOptionsData::parse( packet_begin, packet_end, pos, rdata_end );
            break;
        default:
            parsed_data = RDATAPtr( new RecordRaw( record.mType, std::vector<uint8_t>( pos, rdata_end ) ) );
            break;
        }

        record.mRData = parsed_data;
        return ResourceRecordPair( record, rdata_end );
    }

    std::string typeCodeToString( Type t )
    {
        switch ( t ) {
        case TYPE_A:
            return "A";
        case TYPE_NS:
            return "NS";
        case TYPE_CNAME:
            return "CNAME";
        case TYPE_SOA:
            return "SOA";
        case TYPE_TXT:
            return "TXT";
        case TYPE_AAAA:
            return "AAAA";
        case TYPE_DNAME:
            return "DNAME";
        case TYPE_OPT:
            return "OPT";
        case TYPE_DS:
            return "DS";
        case TYPE_RRSIG:
            return "RRSIG";
        case TYPE_NSEC:
            return "NSEC";
        case TYPE_DNSKEY:
            return "DNSKEY";
        case TYPE_NSEC3:
            return "NSEC3";
        case TYPE_TLSA:
            return "TLSA";
        case TYPE_ANY:
            return "ANY";
        default:
            return "TYPE" + boost::lexical_cast<std::string>( t );
        }
    }

    Type stringToTypeCode( const std::string &t )
    {
        if ( t == "A" )      return TYPE_A;
        if ( t == "NS" )     return TYPE_NS;
        if ( t == "CNAME" )  return TYPE_CNAME;
        if ( t == "SOA" )    return TYPE_SOA;
        if ( t == "TXT" )    return TYPE_TXT;
        if ( t == "AAAA" )   return TYPE_AAAA;
        if ( t == "DNAME" )  return TYPE_DNAME;
        if ( t == "OPT" )    return TYPE_OPT;
        if ( t == "DS" )     return TYPE_DS;
        if ( t == "RRSIG" )  return TYPE_RRSIG;
        if ( t == "NSEC" )   return TYPE_NSEC;
        if ( t == "DNSKEY" ) return TYPE_DNSKEY;
        if ( t == "NSEC3" )  return TYPE_NSEC3;
        if ( t == "TLSA" )   return TYPE_TLSA;
        if ( t == "ANY" )    return TYPE_ANY;
        if ( t.compare( 0, 4, "TYPE" ) == 0 && t.size() > 4 ) {
            unsigned int code = 0;
            if ( boost::conversion::try_lexical_convert( t.substr( 4 ), code ) && code <= 0xffff )
                return code;
        }

        throw std::runtime_error( "unknown type \"" + t + "\"" );
    }

    std::string responseCodeToString( uint8_t rcode )
    {
        const char *rcode2str[] = {
            "NOERROR", "FORMERR", "SERVFAIL", "NXDOMAIN", "NOTIMP", "REFUSED",
            "YXDOMAIN", "YXRRSET", "NXRRSET", "NOTAUTH", "NOTZONE",
        };

        if ( rcode < sizeof( rcode2str ) / sizeof( char * ) )
            return rcode2str[ rcode ];
        return "RCODE" + boost::lexical_cast<std::string>( (unsigned int)rcode );
    }

    std::ostream &operator<<( std::ostream &os, const MessageInfo &res )
    {
        os << "ID: " << res.mID << ", "
           << "QR: " << res.mQueryResponse << ", "
           << "TC: " << res.mTruncation << ", "
           << "RD: " << res.mRecursionDesired << ", "
           << "AD: " << res.mAuthenticData << ", "
           << "CD: " << res.mCheckingDisabled << ", "
           << "RCODE: " << responseCodeToString( res.mResponseCode ) << std::endl;

        for ( auto &q : res.mQuestionSection )
            os << "Query: " << q.mDomainname << " " << typeCodeToString( q.mType ) << std::endl;
        for ( auto &a : res.mAnswerSection )
            os << "Answer: " << a.mDomainname << " " << a.mTTL << " " << typeCodeToString( a.mType ) << " "
               << a.mRData->toZone() << std::endl;
        for ( auto &a : res.mAuthoritySection )
            os << "Authority: " << a.mDomainname << " " << a.mTTL << " " << typeCodeToString( a.mType ) << " "
               << a.mRData->toZone() << std::endl;

        return os;
    }

    /*******************************************************************************************
     * RecordRaw
     *******************************************************************************************/
    std::string RecordRaw::toZone() const
    {
        std::string hex;
        encodeToHex( mData, hex );
        std::ostringstream os;
        os << "\\# " << mData.size() << " " << hex;
        return os.str();
    }

    std::string RecordRaw::toString() const
    {
        std::ostringstream os;
        os << "type: " << typeCodeToString( mRRType ) << ", data: " << toZone();
        return os.str();
    }

    void RecordRaw::outputWireFormat( WireFormat &message ) const
    {
        message.pushBuffer( mData );
    }

    void RecordRaw::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushBuffer( mData );
    }

    /*******************************************************************************************
     * RecordSOA
     *******************************************************************************************/
    RecordSOA::RecordSOA( const Domainname &mn,
                          const Domainname &rn,
                          uint32_t          sr,
                          uint32_t          rf,
                          uint32_t          rt,
                          uint32_t          ex,
                          uint32_t          min )
        : mMName( mn ), mRName( rn ), mSerial( sr ), mRefresh( rf ), mRetry( rt ), mExpire( ex ), mMinimum( min )
    {
    }

    std::string RecordSOA::toZone() const
    {
        std::ostringstream soa_str;
        soa_str << mMName.toString() << " " << mRName.toString() << " " << mSerial << " " << mRefresh << " " << mRetry << " "
                << mExpire << " " << mMinimum;
        return soa_str.str();
    }

    std::string RecordSOA::toString() const
    {
        return "SOA: " + toZone();
    }

    void RecordSOA::outputWireFormat( WireFormat &message ) const
    {
        mMName.outputWireFormat( message );
        mRName.outputWireFormat( message );
        message.pushUInt32HtoN( mSerial );
        message.pushUInt32HtoN( mRefresh );
        message.pushUInt32HtoN( mRetry );
        message.pushUInt32HtoN( mExpire );
        message.pushUInt32HtoN( mMinimum );
    }

    void RecordSOA::outputCanonicalWireFormat( WireFormat &message ) const
    {
        mMName.outputCanonicalWireFormat( message );
        mRName.outputCanonicalWireFormat( message );
        message.pushUInt32HtoN( mSerial );
        message.pushUInt32HtoN( mRefresh );
        message.pushUInt32HtoN( mRetry );
        message.pushUInt32HtoN( mExpire );
        message.pushUInt32HtoN( mMinimum );
    }

    uint16_t RecordSOA::size() const
    {
        return mMName.size() + mRName.size() + sizeof( mSerial ) + sizeof( mRefresh ) + sizeof( mRetry ) +
               sizeof( mExpire ) + sizeof( mMinimum );
    }

    RDATAPtr RecordSOA::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        Domainname     mname_result, rname_result;
        const uint8_t *pos = rdata_begin;
        pos                = Domainname::parsePacket( mname_result, packet_begin, packet_end, pos );
        pos                = Domainname::parsePacket( rname_result, packet_begin, packet_end, pos );
        checkRemain( pos, rdata_end, sizeof( uint32_t ) * 5, "SOA" );
        uint32_t serial  = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t refresh = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t retry   = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t expire  = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t minimum = ntohl( get_bytes<uint32_t>( &pos ) );

        return RDATAPtr( new RecordSOA( mname_result, rname_result, serial, refresh, retry, expire, minimum ) );
    }

    /*******************************************************************************************
     * RecordRRSIG
     *******************************************************************************************/
    static std::string formatSignatureTime( uint32_t t )
    {
        time_t time = t;
        tm     time_tm;
        gmtime_r( &time, &time_tm );
        char time_str[ 32 ];
        strftime( time_str, sizeof( time_str ), "%Y%m%d%H%M%S", &time_tm );
        return time_str;
    }

    std::string RecordRRSIG::toZone() const
    {
        std::string signature_str;
        encodeToBase64( mSignature, signature_str );

        std::ostringstream os;
        os << typeCodeToString( mTypeCovered ) << " "
           << (uint32_t)mAlgorithm << " "
           << (uint32_t)mLabelCount << " "
           << mOriginalTTL << " "
           << formatSignatureTime( mExpiration ) << " "
           << formatSignatureTime( mInception ) << " "
           << mKeyTag << " "
           << mSigner.toString() << " "
           << signature_str;
        return os.str();
    }

    std::string RecordRRSIG::toString() const
    {
        std::ostringstream os;
        os << "Type Covered: " << typeCodeToString( mTypeCovered ) << ", "
           << "Algorithm: " << (uint32_t)mAlgorithm << ", "
           << "Label Count: " << (uint32_t)mLabelCount << ", "
           << "Original TTL: " << mOriginalTTL << ", "
           << "Expiration: " << mExpiration << ", "
           << "Inception: " << mInception << ", "
           << "Key Tag: " << mKeyTag << ", "
           << "Signer: " << mSigner;
        return os.str();
    }

    void RecordRRSIG::outputSignedFields( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mTypeCovered );
        message.pushUInt8( mAlgorithm );
        message.pushUInt8( mLabelCount );
        message.pushUInt32HtoN( mOriginalTTL );
        message.pushUInt32HtoN( mExpiration );
        message.pushUInt32HtoN( mInception );
        message.pushUInt16HtoN( mKeyTag );
        mSigner.outputCanonicalWireFormat( message );
    }

    void RecordRRSIG::outputWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mTypeCovered );
        message.pushUInt8( mAlgorithm );
        message.pushUInt8( mLabelCount );
        message.pushUInt32HtoN( mOriginalTTL );
        message.pushUInt32HtoN( mExpiration );
        message.pushUInt32HtoN( mInception );
        message.pushUInt16HtoN( mKeyTag );
        mSigner.outputWireFormat( message );
        message.pushBuffer( mSignature );
    }

    void RecordRRSIG::outputCanonicalWireFormat( WireFormat &message ) const
    {
        outputSignedFields( message );
        message.pushBuffer( mSignature );
    }

    RDATAPtr RecordRRSIG::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        const uint8_t *pos = rdata_begin;
        checkRemain( pos, rdata_end, 18, "RRSIG" );
        Type     type_covered = ntohs( get_bytes<uint16_t>( &pos ) );
        uint8_t  algorithm    = get_bytes<uint8_t>( &pos );
        uint8_t  label_count  = get_bytes<uint8_t>( &pos );
        uint32_t original_ttl = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t expiration   = ntohl( get_bytes<uint32_t>( &pos ) );
        uint32_t inception    = ntohl( get_bytes<uint32_t>( &pos ) );
        uint16_t key_tag      = ntohs( get_bytes<uint16_t>( &pos ) );

        // signer name must not be compressed (RFC 4034 3.1.7), so parse it within RDATA
        Domainname signer;
        pos = Domainname::parsePacket( signer, rdata_begin, rdata_end, pos );
        if ( pos > rdata_end )
            throw FormatError( "signer name of RRSIG exceeds RDATA" );

        std::vector<uint8_t> signature( pos, rdata_end );

        return RDATAPtr( new RecordRRSIG( type_covered, algorithm, label_count, original_ttl, expiration, inception, key_tag,
                                          signer, signature ) );
    }

    /*******************************************************************************************
     * RecordDNSKEY
     *******************************************************************************************/
    std::string RecordDNSKEY::toZone() const
    {
        std::string public_key_str;
        encodeToBase64( mPublicKey, public_key_str );

        std::ostringstream os;
        os << mFlag << " "
           << (unsigned int)mProtocol << " "
           << (unsigned int)mAlgorithm << " "
           << public_key_str;
        return os.str();
    }

    std::string RecordDNSKEY::toString() const
    {
        std::ostringstream os;
        os << "Flags: " << mFlag << ", "
           << "Protocol: " << (unsigned int)mProtocol << ", "
           << "Algorithm: " << (unsigned int)mAlgorithm << ", "
           << "Key Tag: " << getKeyTag();
        return os.str();
    }

    void RecordDNSKEY::outputWireFormat( WireFormat &message ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordDNSKEY::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mFlag );
        message.pushUInt8( mProtocol );
        message.pushUInt8( mAlgorithm );
        message.pushBuffer( mPublicKey );
    }

    uint16_t RecordDNSKEY::getKeyTag() const
    {
        // RSA/MD5 uses the most significant 16 bits of the least significant 24 bits of the modulus
        if ( mAlgorithm == 1 ) {
            if ( mPublicKey.size() < 3 )
                return 0;
            return ( mPublicKey[ mPublicKey.size() - 3 ] << 8 ) + mPublicKey[ mPublicKey.size() - 2 ];
        }

        WireFormat rdata;
        outputCanonicalWireFormat( rdata );

        uint32_t ac = 0;
        for ( uint32_t i = 0; i < rdata.size(); ++i )
            ac += ( i & 1 ) ? rdata[ i ] : rdata[ i ] << 8;
        ac += ( ac >> 16 ) & 0xFFFF;
        return ac & 0xFFFF;
    }

    RDATAPtr RecordDNSKEY::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        const uint8_t *pos = rdata_begin;
        checkRemain( pos, rdata_end, 4, "DNSKEY" );
        uint16_t   f        = ntohs( get_bytes<uint16_t>( &pos ) );
        uint8_t    protocol = get_bytes<uint8_t>( &pos );
        uint8_t    algo     = get_bytes<uint8_t>( &pos );
        PacketData key( pos, rdata_end );

        return RDATAPtr( new RecordDNSKEY( f, algo, key, protocol ) );
    }

    /*******************************************************************************************
     * RecordDS
     *******************************************************************************************/
    std::string RecordDS::toZone() const
    {
        std::string digest_str;
        encodeToHex( mDigest, digest_str );

        std::ostringstream os;
        os << mKeyTag << " "
           << (unsigned int)mAlgorithm << " "
           << (unsigned int)mDigestType << " "
           << digest_str;
        return os.str();
    }

    std::string RecordDS::toString() const
    {
        std::string digest_str;
        encodeToHex( mDigest, digest_str );

        std::ostringstream os;
        os << "keytag: " << mKeyTag << ", "
           << "algorithm: " << (unsigned int)mAlgorithm << ", "
           << "digest type: " << (unsigned int)mDigestType << ", "
           << "digest: " << digest_str;
        return os.str();
    }

    void RecordDS::outputWireFormat( WireFormat &message ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordDS::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt16HtoN( mKeyTag );
        message.pushUInt8( mAlgorithm );
        message.pushUInt8( mDigestType );
        message.pushBuffer( mDigest );
    }

    RDATAPtr RecordDS::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        const uint8_t *pos = rdata_begin;
        checkRemain( pos, rdata_end, 4, "DS" );
        uint16_t tag   = ntohs( get_bytes<uint16_t>( &pos ) );
        uint8_t  algo  = get_bytes<uint8_t>( &pos );
        uint8_t  dtype = get_bytes<uint8_t>( &pos );

        PacketData d( pos, rdata_end );

        return RDATAPtr( new RecordDS( tag, algo, dtype, d ) );
    }

    /*******************************************************************************************
     * RecordTLSA
     *******************************************************************************************/
    std::string RecordTLSA::toZone() const
    {
        std::string data_str;
        encodeToHex( mData, data_str );

        std::ostringstream os;
        os << (unsigned int)mUsage << " "
           << (unsigned int)mSelector << " "
           << (unsigned int)mMatchingType << " "
           << data_str;
        return os.str();
    }

    std::string RecordTLSA::toString() const
    {
        std::string data_str;
        encodeToHex( mData, data_str );

        std::ostringstream os;
        os << "usage: " << (unsigned int)mUsage << ", "
           << "selector: " << (unsigned int)mSelector << ", "
           << "matching type: " << (unsigned int)mMatchingType << ", "
           << "data: " << data_str;
        return os.str();
    }

    void RecordTLSA::outputWireFormat( WireFormat &message ) const
    {
        outputCanonicalWireFormat( message );
    }

    void RecordTLSA::outputCanonicalWireFormat( WireFormat &message ) const
    {
        message.pushUInt8( mUsage );
        message.pushUInt8( mSelector );
        message.pushUInt8( mMatchingType );
        message.pushBuffer( mData );
    }

    RDATAPtr RecordTLSA::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        const uint8_t *pos = rdata_begin;
        checkRemain( pos, rdata_end, 3, "TLSA" );
        uint8_t usage         = get_bytes<uint8_t>( &pos );
        uint8_t selector      = get_bytes<uint8_t>( &pos );
        uint8_t matching_type = get_bytes<uint8_t>( &pos );

        PacketData data( pos, rdata_end );

        return RDATAPtr( new RecordTLSA( usage, selector, matching_type, data ) );
    }

    /*******************************************************************************************
     * RecordOptionsData
     *******************************************************************************************/
    std::string RecordOptionsData::toString() const
    {
        std::ostringstream os;
        for ( auto &option : mOptions ) {
            std::string hex;
            encodeToHex( option.mData, hex );
            os << "option " << option.mCode << ": " << hex << "; ";
        }
        return os.str();
    }

    void RecordOptionsData::outputWireFormat( WireFormat &message ) const
    {
        for ( auto &option : mOptions ) {
            message.pushUInt16HtoN( option.mCode );
            message.pushUInt16HtoN( option.mData.size() );
            message.pushBuffer( option.mData );
        }
    }

    void RecordOptionsData::outputCanonicalWireFormat( WireFormat &message ) const
    {
        outputWireFormat( message );
    }

    uint16_t RecordOptionsData::size() const
    {
        uint16_t rr_size = 0;
        for ( auto &option : mOptions ) {
            rr_size += 4 + option.mData.size();
        }
        return rr_size;
    }

    RDATAPtr RecordOptionsData::parse( const uint8_t *packet_begin, const uint8_t *packet_end, const uint8_t *rdata_begin, const uint8_t *rdata_end )
    {
        const uint8_t *pos = rdata_begin;

        std::vector<EDNSOption> options;
        while ( pos < rdata_end ) {
            checkRemain( pos, rdata_end, 4, "EDNS option" );
            EDNSOption option;
            option.mCode         = ntohs( get_bytes<uint16_t>( &pos ) );
            uint16_t option_size = ntohs( get_bytes<uint16_t>( &pos ) );
            checkRemain( pos, rdata_end, option_size, "EDNS option data" );
            option.mData.assign( pos, pos + option_size );
            options.push_back( option );
            pos += option_size;
        }

        return RDATAPtr( new RecordOptionsData( options ) );
    }

    ResourceRecord generateOptPseudoRecord( const OptPseudoRecord &opt )
    {
        ResourceRecord entry;
        entry.mDomainname = Domainname();
        entry.mType       = TYPE_OPT;
        entry.mClass      = opt.mPayloadSize;
        entry.mTTL        = ( ( (uint32_t)opt.mRCode ) << 24 ) + ( ( (uint32_t)opt.mVersion ) << 16 ) +
                     ( opt.mDOBit ? ( (uint32_t)1 << 15 ) : 0 );
        entry.mRData = opt.mOptions ? opt.mOptions : RDATAPtr( new RecordOptionsData );

        return entry;
    }

    OptPseudoRecord parseOPTPseudoRecord( const ResourceRecord &record )
    {
        OptPseudoRecord opt;
        opt.mPayloadSize = record.mClass;
        opt.mRCode       = record.mTTL >> 24;
        opt.mVersion     = 0xff & ( record.mTTL >> 16 );
        opt.mDOBit       = ( record.mTTL & ( (uint32_t)1 << 15 ) ) ? true : false;
        opt.mOptions     = record.mRData;

        return opt;
    }
}
