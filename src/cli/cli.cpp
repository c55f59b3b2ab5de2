#include "cli/cli.hpp"
#include "dag/dag_builder.hpp"
#include "transfer/downloader.hpp"
#include "transfer/transfer_task.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace dagsync {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(transfer::TransferConfig config, std::istream& in, std::ostream& out)
  : running_(false)
  , config_(std::move(config))
  , in_(in)
  , out_(out) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "dagsync> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "dagsync> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  Arguments args = parse_arguments(iss);
  try {
    last_failed_ = !process_command(command, args);
  } catch (const std::exception& e) {
    // The shell outlives failed commands
    last_failed_ = true;
    log_and_display_error("Error running '" + command + "'", e.what());
  }
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

CLI::Arguments CLI::parse_arguments(std::istringstream& iss) {
  Arguments args;
  std::string token;
  while (iss >> token) {
    if (token == "--compress") {
      args.compress = true;
    } else if (token == "--password") {
      std::string password;
      if (iss >> password) {
        args.password = password;
      } else {
        args.password = std::string();
      }
    } else {
      args.positional.push_back(token);
    }
  }
  return args;
}

bool CLI::process_command(const std::string& command, const Arguments& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.positional.size() << " arguments";

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "upload" && args.positional.size() == 1) {
    handle_upload_command(args);
  }
  else if (command == "download" && args.positional.size() == 2) {
    handle_download_command(args);
  }
  else if (command == "cat" && args.positional.size() == 1) {
    handle_cat_command(args);
  }
  else if (command == "stat" && args.positional.size() == 1) {
    handle_stat_command(args);
  }
  else if (command == "cid" && args.positional.size() == 1) {
    handle_cid_command(args);
  }
  else {
    out_ << "Unknown command or invalid arguments (try 'help')" << std::endl;
    return false;
  }
  return true;
}

void CLI::handle_upload_command(const Arguments& args) {
  transfer::UploadOptions options;
  options.compression = args.compress;
  options.password = args.password;

  auto task = transfer::start_upload(config_, std::filesystem::path(args.positional[0]), options);
  follow_progress(*task.channel);
  transfer::UploadResult result = task.get();

  out_ << "Uploaded " << args.positional[0] << "\n"
       << "  root: " << result.metadata_cid << "\n"
       << "  data: " << result.data_cid << "\n"
       << "  size: " << result.original_size << " bytes (" << result.stored_size << " stored, "
       << result.blocks_sent << " blocks sent)" << std::endl;
}

void CLI::handle_download_command(const Arguments& args) {
  transfer::DownloadOptions options;
  options.password = args.password;

  auto task = transfer::start_download(config_, dag::cid_from_string(args.positional[0]),
                                       std::filesystem::path(args.positional[1]), options);
  follow_progress(*task.channel);
  task.get();
  out_ << "Downloaded " << args.positional[0] << " to " << args.positional[1] << std::endl;
}

void CLI::handle_cat_command(const Arguments& args) {
  transfer::DownloadOptions options;
  options.password = args.password;

  transfer::Downloader downloader(config_);
  auto stream = downloader.open(dag::cid_from_string(args.positional[0]), options);

  Bytes piece;
  while (stream->read(piece)) {
    out_.write(reinterpret_cast<const char*>(piece.data()), static_cast<std::streamsize>(piece.size()));
  }
  out_ << std::endl;
}

void CLI::handle_stat_command(const Arguments& args) {
  dag::Cid cid = dag::cid_from_string(args.positional[0]);
  transfer::Downloader downloader(config_);
  dag::Node node = downloader.stat(cid);

  out_ << cid << "\n"
       << "  kind:  " << dag::node_kind_name(node) << "\n"
       << "  size:  " << dag::node_size(node) << " bytes\n";

  if (auto* file = std::get_if<dag::FileNode>(&node)) {
    if (file->inline_data) {
      out_ << "  inline payload" << "\n";
    }
    for (const auto& link : file->links) {
      out_ << "  - " << link.cid << " (" << link.size << " bytes)\n";
    }
  } else if (auto* folder = std::get_if<dag::FolderNode>(&node)) {
    for (const auto& entry : folder->entries) {
      out_ << "  " << (entry.kind == dag::EntryKind::Folder ? "[DIR] " : "[FILE]") << " " << entry.name
           << " " << entry.cid << " (" << entry.size << " bytes)\n";
    }
  } else if (auto* metadata = std::get_if<dag::MetadataNode>(&node)) {
    out_ << "  name:  " << metadata->name << "\n"
         << "  mime:  " << metadata->mime_type << "\n"
         << "  data:  " << metadata->data_cid << "\n";
    if (metadata->compression) {
      out_ << "  compression: " << metadata->compression->algorithm << "\n";
    }
    if (metadata->encryption) {
      out_ << "  encryption:  " << metadata->encryption->algorithm << " (" << metadata->encryption->iterations
           << " iterations)\n";
    }
  }
  out_ << std::flush;
}

void CLI::handle_cid_command(const Arguments& args) {
  io::FileSource source(args.positional[0]);
  dag::DagBuilder builder(config_.builder);
  dag::NullSink sink;
  dag::DagHead head = builder.build_file(source, sink);
  out_ << head.cid << " (" << sink.count() << " blocks, nothing uploaded)" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                                    Display this help message" << std::endl;
  out_ << "  upload <path> [--compress] [--password <pw>]" << std::endl;
  out_ << "                                          Upload a file or folder and print its root CID" << std::endl;
  out_ << "  download <cid> <path> [--password <pw>] Download a file or folder to <path>" << std::endl;
  out_ << "  cat <cid> [--password <pw>]             Print a file's contents" << std::endl;
  out_ << "  stat <cid>                              Describe a single node" << std::endl;
  out_ << "  cid <file>                              Compute a file's CID without uploading" << std::endl;
  out_ << "  quit                                    Exit the shell" << std::endl << std::endl;
}

void CLI::follow_progress(transfer::ProgressChannel& channel) {
  transfer::ProgressEvent event;
  while (true) {
    if (!channel.wait_consume(event, std::chrono::milliseconds(200))) {
      continue;
    }
    if (event.kind == transfer::EventKind::Progress) {
      out_ << "\r  " << transfer::direction_name(event.direction) << " " << event.processed_bytes << "/"
           << event.total_bytes << " bytes (" << std::fixed << std::setprecision(1) << event.percent() << "%)"
           << std::flush;
      continue;
    }
    out_ << "\r  " << transfer::direction_name(event.direction)
         << (event.kind == transfer::EventKind::Success ? " done" : " failed") << std::endl;
    return;
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace dagsync
