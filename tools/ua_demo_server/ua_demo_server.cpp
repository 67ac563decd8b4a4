// ua_demo_server.cpp – lokaler OPC-UA-Server zum Ausprobieren von uabridge_demo
//
//   ua_demo_server [port] [server_cert.der server_key.der]
//
// Ohne Zertifikat: nur SecurityPolicy None, Anonymous erlaubt.
// Mit Zertifikat : zusätzlich Basic256Sha256 / SignAndEncrypt, Login user/pass.
//
// Adressraum (ns=1) unter Objects/Demo:
//   Int16, Int32, Float, Double, String, ByteString, Bool   (lesen + schreiben)
//   Int32Array, DoubleArray                                 (lesen + schreiben)
//   ReadOnly                                                (nur lesen)
//   Counter                                                 (+1 je Sekunde)
//   Loop/BackToDemo                                         (Organizes-Zyklus zurück auf Demo)
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <open62541/plugin/log_stdout.h>
#include <open62541/server.h>
#include <open62541/server_config_default.h>
#include <open62541/plugin/securitypolicy_default.h>
#include <open62541/plugin/accesscontrol_default.h>
#include <open62541/nodeids.h>

/* --------- Datei-Loader (DER) --------- */
static UA_ByteString loadFile(const char *path) {
    UA_ByteString bs = UA_BYTESTRING_NULL;
    FILE *f = fopen(path, "rb");
    if(!f) return bs;
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    if(sz <= 0) { fclose(f); return bs; }
    fseek(f, 0, SEEK_SET);
    bs.length = (size_t)sz;
    bs.data   = (UA_Byte*)UA_malloc(bs.length);
    if(!bs.data) { fclose(f); bs.length = 0; return UA_BYTESTRING_NULL; }
    size_t rd = fread(bs.data, 1, bs.length, f);
    fclose(f);
    if(rd != bs.length) { UA_ByteString_clear(&bs); return UA_BYTESTRING_NULL; }
    return bs;
}

static volatile UA_Boolean gRunning = true;
static void stopHandler(int) { gRunning = false; }

static UA_NodeId gCounterId = UA_NODEID_NULL;

/* --------- Zähler (1/s) --------- */
static void counterTick(UA_Server* server, void*) {
    UA_Variant var; UA_Variant_init(&var);
    UA_UInt32 cur = 0;
    if(UA_Server_readValue(server, gCounterId, &var) == UA_STATUSCODE_GOOD &&
       UA_Variant_isScalar(&var) &&
       var.type == &UA_TYPES[UA_TYPES_UINT32] && var.data) {
        cur = *static_cast<UA_UInt32*>(var.data);
    }
    UA_Variant_clear(&var);
    UA_UInt32 next = cur + 1;
    UA_Variant_setScalar(&var, &next, &UA_TYPES[UA_TYPES_UINT32]);
    UA_Server_writeValue(server, gCounterId, var);
}

/* --------- Knoten anlegen --------- */
static UA_StatusCode addFolder(UA_Server* server, const char* name, const UA_NodeId& parent,
                               UA_NodeId& outId) {
    UA_ObjectAttributes oa = UA_ObjectAttributes_default;
    oa.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(name));
    return UA_Server_addObjectNode(server,
        UA_NODEID_STRING(1, const_cast<char*>(name)),
        parent,
        UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES),
        UA_QUALIFIEDNAME(1, const_cast<char*>(name)),
        UA_NODEID_NUMERIC(0, UA_NS0ID_FOLDERTYPE),
        oa, NULL, &outId);
}

// value zeigt auf einen Skalar bzw. (arrayLen > 0) auf ein Array vom Typ typeIndex
static UA_StatusCode addVar(UA_Server* server, const UA_NodeId& parent, const char* name,
                            const void* value, size_t arrayLen, int typeIndex,
                            UA_Byte access, UA_NodeId* outId = NULL) {
    UA_VariableAttributes a = UA_VariableAttributes_default;
    const UA_DataType* type = &UA_TYPES[typeIndex];
    if(arrayLen > 0) {
        UA_Variant_setArray(&a.value, const_cast<void*>(value), arrayLen, type);
        a.valueRank = UA_VALUERANK_ONE_DIMENSION;
        UA_UInt32 dims[1] = { (UA_UInt32)arrayLen };
        a.arrayDimensions = dims;
        a.arrayDimensionsSize = 1;
    } else {
        UA_Variant_setScalar(&a.value, const_cast<void*>(value), type);
        a.valueRank = UA_VALUERANK_SCALAR;
    }
    a.displayName = UA_LOCALIZEDTEXT(const_cast<char*>("en-US"), const_cast<char*>(name));
    a.dataType    = type->typeId;
    a.accessLevel = access;
    a.userAccessLevel = access;

    char idBuf[128];
    snprintf(idBuf, sizeof(idBuf), "Demo.%s", name);
    // addVariableNode kopiert die Attribute, dims darf danach ungültig werden
    return UA_Server_addVariableNode(server,
        UA_NODEID_STRING(1, idBuf),
        parent,
        UA_NODEID_NUMERIC(0, UA_NS0ID_HASCOMPONENT),
        UA_QUALIFIEDNAME(1, const_cast<char*>(name)),
        UA_NODEID_NUMERIC(0, UA_NS0ID_BASEDATAVARIABLETYPE),
        a, NULL, outId);
}

/* --------- main --------- */
int main(int argc, char** argv) {
    signal(SIGINT,  stopHandler);
    signal(SIGTERM, stopHandler);

    const UA_UInt16 port = argc > 1 ? (UA_UInt16)atoi(argv[1]) : 4840;
    const bool secure = argc > 3;

    UA_Server *server = UA_Server_new();
    UA_ServerConfig *config = UA_Server_getConfig(server);

    UA_ByteString cert = UA_BYTESTRING_NULL;
    UA_ByteString key  = UA_BYTESTRING_NULL;
    if(secure) {
        cert = loadFile(argv[2]);
        key  = loadFile(argv[3]);
        if(cert.length == 0 || key.length == 0) {
            UA_LOG_ERROR(UA_Log_Stdout, UA_LOGCATEGORY_SERVER, "Zertifikat/Schluessel nicht lesbar");
            UA_Server_delete(server);
            return EXIT_FAILURE;
        }
    }
    UA_ServerConfig_setMinimal(config, port, secure ? &cert : NULL);

    if(secure) {
        /* SecurityPolicy + Endpoint */
        UA_ServerConfig_addSecurityPolicyBasic256Sha256(config, &cert, &key);
        UA_String policyUri = UA_STRING_ALLOC("http://opcfoundation.org/UA/SecurityPolicy#Basic256Sha256");
        UA_ServerConfig_addEndpoint(config, policyUri, UA_MESSAGESECURITYMODE_SIGNANDENCRYPT);

        /* Access Control: Anonymous erlaubt, zusätzlich Username/Passwort (user/pass) */
        static const UA_UsernamePasswordLogin users[1] = {
            { UA_STRING_STATIC("user"), UA_STRING_STATIC("pass") }
        };
        UA_AccessControl_default(config, UA_TRUE, &policyUri, 1, users);
        UA_String_clear(&policyUri);
    }

    /* Objects/Demo */
    UA_NodeId demoId;
    addFolder(server, "Demo", UA_NODEID_NUMERIC(0, UA_NS0ID_OBJECTSFOLDER), demoId);

    const UA_Byte rw = UA_ACCESSLEVELMASK_READ | UA_ACCESSLEVELMASK_WRITE;
    const UA_Byte ro = UA_ACCESSLEVELMASK_READ;

    UA_Int16   i16 = -12;
    UA_Int32   i32 = 42;
    UA_Float   f32 = 1.5f;
    UA_Double  f64 = 3.25;
    UA_Boolean b   = UA_FALSE;
    UA_String  str = UA_STRING(const_cast<char*>("hello"));
    UA_Byte    raw[4] = { 0xDE, 0xAD, 0xBE, 0xEF };
    UA_ByteString bs; bs.length = sizeof(raw); bs.data = raw;
    UA_Int32   i32Arr[3] = { 1, 2, 3 };
    UA_Double  dblArr[2] = { 0.5, -0.5 };
    UA_String  roText = UA_STRING(const_cast<char*>("fixed"));
    UA_UInt32  counter = 0;

    addVar(server, demoId, "Int16",       &i16,    0, UA_TYPES_INT16,      rw);
    addVar(server, demoId, "Int32",       &i32,    0, UA_TYPES_INT32,      rw);
    addVar(server, demoId, "Float",       &f32,    0, UA_TYPES_FLOAT,      rw);
    addVar(server, demoId, "Double",      &f64,    0, UA_TYPES_DOUBLE,     rw);
    addVar(server, demoId, "String",      &str,    0, UA_TYPES_STRING,     rw);
    addVar(server, demoId, "ByteString",  &bs,     0, UA_TYPES_BYTESTRING, rw);
    addVar(server, demoId, "Bool",        &b,      0, UA_TYPES_BOOLEAN,    rw);
    addVar(server, demoId, "Int32Array",  i32Arr,  3, UA_TYPES_INT32,      rw);
    addVar(server, demoId, "DoubleArray", dblArr,  2, UA_TYPES_DOUBLE,     rw);
    addVar(server, demoId, "ReadOnly",    &roText, 0, UA_TYPES_STRING,     ro);
    addVar(server, demoId, "Counter",     &counter, 0, UA_TYPES_UINT32,    ro, &gCounterId);

    /* Zyklus: Demo/Loop organisiert wieder Demo */
    UA_NodeId loopId;
    addFolder(server, "Loop", demoId, loopId);
    UA_ExpandedNodeId backTarget = UA_EXPANDEDNODEID_NUMERIC(0, 0);
    backTarget.nodeId = demoId;
    UA_Server_addReference(server, loopId, UA_NODEID_NUMERIC(0, UA_NS0ID_ORGANIZES),
                           backTarget, UA_TRUE);

    UA_UInt64 repCounter = 0;
    UA_Server_addRepeatedCallback(server, counterTick, nullptr, 1000.0, &repCounter);   // 1 s

    UA_LOG_INFO(UA_Log_Stdout, UA_LOGCATEGORY_SERVER,
        "[Server] Demo-Server laeuft auf opc.tcp://localhost:%u (%s)", (unsigned)port,
        secure ? "None + Basic256Sha256/SignAndEncrypt" : "None");

    UA_StatusCode ret = UA_Server_run(server, &gRunning);

    UA_Server_delete(server);
    UA_ByteString_clear(&cert);
    UA_ByteString_clear(&key);
    return (ret == UA_STATUSCODE_GOOD) ? 0 : (int)ret;
}
