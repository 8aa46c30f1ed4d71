#include "ferry/client/session.hpp"

#include <filesystem>
#include <fstream>

namespace ferry::client
{

    bool ClientSession::handle_list(const std::vector<std::string> & /*args*/)
    {
        for (const auto &row : client_.list())
        {
            output_ << row << std::endl;
        }
        return true;
    }

    bool ClientSession::handle_get(const std::vector<std::string> &args)
    {
        if (args.empty())
        {
            output_ << "Usage: get <remote_filename> [local_filename]" << std::endl;
            return true;
        }

        std::string remote;
        std::filesystem::path local;
        if (args.size() >= 2)
        {
            for (std::size_t i = 0; i + 1 < args.size(); ++i)
            {
                remote += (i == 0 ? "" : " ") + args[i];
            }
            local = args.back();
        }
        else
        {
            remote = args.front();
            local = std::filesystem::path(remote).filename();
        }

        auto part_path = local;
        part_path += ".part";
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            output_ << "Cannot open " << part_path.string() << " for writing." << std::endl;
            return true;
        }

        try
        {
            const auto size = client_.get(remote, out);
            out.close();
            std::filesystem::rename(part_path, local);
            output_ << "Downloaded: " << local.string() << " -> " << std::filesystem::absolute(local).string()
                    << " (" << size << " bytes)" << std::endl;
            logger_.log("download", remote, " -> ", local.string(), " (", size, " bytes)");
        }
        catch (const ClientError &ex)
        {
            out.close();
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            if (ex.code() == ferry::ErrorCode::TransferIncomplete)
            {
                output_ << "Download incomplete: " << local.string() << " (" << ex.what() << ")" << std::endl;
                logger_.log("error", "download of ", remote, " incomplete: ", ex.what());
                return true;
            }
            throw;
        }
        return true;
    }

    bool ClientSession::handle_put(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            output_ << "Usage: put <local_path>" << std::endl;
            return true;
        }

        const std::filesystem::path local = args.front();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local, ec))
        {
            output_ << "File does not exist." << std::endl;
            return true;
        }
        const auto size = std::filesystem::file_size(local, ec);
        if (ec)
        {
            output_ << "Cannot read " << local.string() << ": " << ec.message() << std::endl;
            return true;
        }
        std::ifstream in(local, std::ios::binary);
        if (!in.is_open())
        {
            output_ << "Cannot open " << local.string() << std::endl;
            return true;
        }

        const auto remote = local.filename().string();
        client_.put(remote, in, size);
        output_ << "Uploaded: " << remote << " (" << size << " bytes)" << std::endl;
        logger_.log("upload", local.string(), " -> ", remote, " (", size, " bytes)");
        return true;
    }

} // namespace ferry::client
