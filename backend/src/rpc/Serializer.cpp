#include "rpc/Serializer.hpp"

#include "utils/Json.hpp"

#include <yyjson.h>

namespace tl::rpc
{

namespace
{

yyjson_mut_val *make_file(json::MutableDocument &doc,
                          engine::FileInfo const &file)
{
    auto *native = doc.doc();
    auto *entry = yyjson_mut_obj(native);
    doc.add_string(entry, "displayPath", file.display_path);
    yyjson_mut_obj_add_sint(native, entry, "length", file.length);
    yyjson_mut_obj_add_sint(native, entry, "offset", file.offset);
    doc.add_string(entry, "path", file.path);
    return entry;
}

yyjson_mut_val *make_stats(json::MutableDocument &doc,
                           engine::TransferStats const &stats)
{
    auto *native = doc.doc();
    auto *entry = yyjson_mut_obj(native);
    yyjson_mut_obj_add_int(native, entry, "activePeers", stats.active_peers);
    yyjson_mut_obj_add_sint(native, entry, "bytesRead", stats.bytes_read);
    yyjson_mut_obj_add_sint(native, entry, "bytesWritten", stats.bytes_written);
    yyjson_mut_obj_add_sint(native, entry, "dataBytesRead",
                            stats.data_bytes_read);
    yyjson_mut_obj_add_sint(native, entry, "dataBytesWritten",
                            stats.data_bytes_written);
    yyjson_mut_obj_add_int(native, entry, "totalPeers", stats.total_peers);
    return entry;
}

yyjson_mut_val *make_transfer(json::MutableDocument &doc,
                              engine::TransferSnapshot const &snapshot)
{
    auto *native = doc.doc();
    auto *entry = yyjson_mut_obj(native);
    yyjson_mut_obj_add_sint(native, entry, "bytesCompleted",
                            snapshot.bytes_completed);
    yyjson_mut_obj_add_sint(native, entry, "bytesMissing",
                            snapshot.bytes_missing);
    auto *files = yyjson_mut_arr(native);
    for (auto const &file : snapshot.files)
    {
        yyjson_mut_arr_append(files, make_file(doc, file));
    }
    yyjson_mut_obj_add_val(native, entry, "files", files);
    doc.add_string(entry, "infoHash", snapshot.info_hash);
    yyjson_mut_obj_add_sint(native, entry, "length", snapshot.length);
    doc.add_string(entry, "magnetLink", snapshot.magnet_link);
    doc.add_string(entry, "name", snapshot.name);
    yyjson_mut_obj_add_int(native, entry, "numPieces", snapshot.num_pieces);
    yyjson_mut_obj_add_bool(native, entry, "seeding", snapshot.seeding);
    yyjson_mut_obj_add_val(native, entry, "stats",
                           make_stats(doc, snapshot.stats));
    yyjson_mut_obj_add_bool(native, entry, "hasInfo", snapshot.has_info);
    return entry;
}

} // namespace

std::string serialize_event(engine::Event const &event)
{
    json::MutableDocument doc;
    auto *root = doc.make_root_object();
    if (root == nullptr)
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *body = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "event", body);
    doc.add_string(body, "type", engine::to_string(event.type));

    engine::TransferSnapshot snapshot;
    if (event.transfer)
    {
        snapshot = engine::snapshot_transfer(*event.transfer);
    }
    yyjson_mut_obj_add_val(native, body, "torrent",
                           make_transfer(doc, snapshot));
    if (event.file)
    {
        yyjson_mut_obj_add_val(native, body, "file",
                               make_file(doc, *event.file));
    }
    if (event.piece)
    {
        yyjson_mut_obj_add_int(native, body, "piece", *event.piece);
    }
    return doc.write();
}

std::string serialize_transfer(engine::TransferSnapshot const &snapshot)
{
    json::MutableDocument doc;
    auto *root = doc.make_root_object();
    if (root == nullptr)
    {
        return "{}";
    }
    yyjson_mut_obj_add_val(doc.doc(), root, "torrent",
                           make_transfer(doc, snapshot));
    return doc.write();
}

std::string serialize_error(std::string_view message)
{
    json::MutableDocument doc;
    auto *root = doc.make_root_object();
    if (root == nullptr)
    {
        return R"({"error":""})";
    }
    doc.add_string(root, "error", message);
    return doc.write(R"({"error":""})");
}

} // namespace tl::rpc
