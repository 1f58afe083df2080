// ─── VeilProxy — Static page templates ──────────────────────────────────

#include "templates.h"
#include "utils.h"

namespace {

const unsigned char kPlaceholderPng[] = {
    0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x00, 0x00, 0x0d,
    0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
    0x08, 0x06, 0x00, 0x00, 0x00, 0x1f, 0x15, 0xc4, 0x89, 0x00, 0x00, 0x00,
    0x0d, 0x49, 0x44, 0x41, 0x54, 0x78, 0xda, 0x63, 0x64, 0x60, 0xf8, 0x5f,
    0x0f, 0x00, 0x02, 0x87, 0x01, 0x80, 0xeb, 0x47, 0xba, 0x92, 0x00, 0x00,
    0x00, 0x00, 0x49, 0x45, 0x4e, 0x44, 0xae, 0x42, 0x60, 0x82};

}  // namespace

const std::string &placeholder_png() {
  static const std::string png(reinterpret_cast<const char *>(kPlaceholderPng),
                               sizeof(kPlaceholderPng));
  return png;
}

const std::string &overlay_head_markup() {
  static const std::string markup = R"HTML(
<style>
#vp-overlay{position:fixed;top:-100px;left:50%;transform:translateX(-50%);
background:rgba(0,0,0,.85);border-radius:16px;padding:16px 20px;
z-index:2147483647;transition:all .4s ease;min-width:450px;opacity:0;
font-family:system-ui,sans-serif}
#vp-overlay.vp-visible{top:20px;opacity:1}
#vp-overlay .vp-row{display:flex;gap:8px;align-items:center}
#vp-search{flex:1;padding:10px 14px;border:1px solid rgba(255,255,255,.2);
border-radius:10px;font-size:14px;background:rgba(255,255,255,.1);color:#fff}
#vp-search::placeholder{color:rgba(255,255,255,.5)}
#vp-overlay button{padding:10px 12px;color:#fff;border:none;border-radius:10px;
cursor:pointer;font-size:14px;min-width:40px}
#vp-refresh{background:#3b82f6}#vp-fullscreen{background:#10b981}
#vp-overlay .vp-count{font-size:11px;color:rgba(255,255,255,.6);
margin-top:8px;text-align:center}
#vp-trigger{position:fixed;top:0;left:0;right:0;height:40px;z-index:2147483646}
</style>
<script>
(function(){
  function go(query){
    if(!query)return;
    fetch('/api/search',{method:'POST',headers:{'Content-Type':'application/json'},
      body:JSON.stringify({query:query})})
      .then(function(r){return r.json();})
      .then(function(d){if(d.url)window.location.href=d.url;})
      .catch(function(e){console.error('search failed',e);});
  }
  document.addEventListener('DOMContentLoaded',function(){
    var box=document.getElementById('vp-overlay');
    var trigger=document.getElementById('vp-trigger');
    var input=document.getElementById('vp-search');
    var count=document.getElementById('vp-user-count');
    if(!box||!trigger||!input)return;
    var hide;
    function show(){clearTimeout(hide);box.classList.add('vp-visible');}
    function later(){hide=setTimeout(function(){box.classList.remove('vp-visible');},200);}
    trigger.addEventListener('mouseenter',show);
    trigger.addEventListener('mousemove',show);
    box.addEventListener('mouseenter',function(){clearTimeout(hide);});
    box.addEventListener('mouseleave',later);
    input.addEventListener('keypress',function(e){
      if(e.key==='Enter'){e.preventDefault();go(this.value.trim());}
    });
    document.getElementById('vp-refresh').addEventListener('click',function(){
      window.location.reload();
    });
    document.getElementById('vp-fullscreen').addEventListener('click',function(){
      if(!document.fullscreenElement)document.documentElement.requestFullscreen();
      else document.exitFullscreen();
    });
    try{
      var ws=new WebSocket((location.protocol==='https:'?'wss:':'ws:')+'//'+location.host+'/ws');
      ws.onmessage=function(ev){
        try{var d=JSON.parse(ev.data);if(d.type==='userCount'&&count)count.textContent=d.count;}catch(e){}
      };
    }catch(e){}
  });
  document.addEventListener('submit',function(e){
    var form=e.target;
    if(!form.action||form.action.indexOf('/proxy/')!==-1)return;
    e.preventDefault();
    var target=form.action;
    if((form.method||'get').toLowerCase()==='get'){
      var params=new URLSearchParams(new FormData(form)).toString();
      target+=(target.indexOf('?')===-1?'?':'&')+params;
    }
    go(target);
  });
})();
</script>
)HTML";
  return markup;
}

const std::string &overlay_body_markup() {
  static const std::string markup = R"HTML(
<div id="vp-overlay">
  <div class="vp-row">
    <input type="text" id="vp-search" placeholder="Search or enter URL..." />
    <button id="vp-refresh" title="Refresh">&#8635;</button>
    <button id="vp-fullscreen" title="Fullscreen">&#9974;</button>
  </div>
  <div class="vp-count"><span id="vp-user-count">1</span> online</div>
</div>
<div id="vp-trigger"></div>
)HTML";
  return markup;
}

const std::string &landing_page_html() {
  static const std::string page = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>VeilProxy</title>
<style>
*{box-sizing:border-box}
body{margin:0;min-height:100vh;display:flex;align-items:center;justify-content:center;
font-family:system-ui,sans-serif;background:linear-gradient(135deg,#0f172a,#1e293b);color:#fff}
.container{text-align:center;max-width:640px;width:100%;padding:24px}
h1{font-size:48px;margin:0 0 8px}
.subtitle{color:rgba(255,255,255,.7);margin-bottom:32px}
.search{display:flex;gap:8px}
.search input{flex:1;padding:16px 20px;border-radius:14px;border:1px solid rgba(255,255,255,.2);
background:rgba(255,255,255,.08);color:#fff;font-size:16px}
.search button{padding:16px 22px;border:none;border-radius:14px;background:#3b82f6;color:#fff;
font-size:18px;cursor:pointer}
.users{margin-top:24px;font-size:13px;color:rgba(255,255,255,.6)}
</style>
</head>
<body>
<div class="container">
  <h1>VeilProxy</h1>
  <p class="subtitle">Browse through an encrypted relay</p>
  <div class="search">
    <input type="text" id="main-search" placeholder="Enter URL or search anything...">
    <button id="main-go">&#8594;</button>
  </div>
  <div class="users"><span id="main-user-count">1</span> users online</div>
</div>
<script>
(function(){
  var input=document.getElementById('main-search');
  var button=document.getElementById('main-go');
  function go(){
    var query=input.value.trim();
    if(!query)return;
    var label=button.textContent;
    button.textContent='...';button.disabled=true;
    fetch('/api/search',{method:'POST',headers:{'Content-Type':'application/json'},
      body:JSON.stringify({query:query})})
      .then(function(r){return r.json();})
      .then(function(d){
        if(d.url){window.location.href=d.url;return;}
        button.textContent=label;button.disabled=false;
      })
      .catch(function(){button.textContent=label;button.disabled=false;});
  }
  button.addEventListener('click',go);
  input.addEventListener('keypress',function(e){if(e.key==='Enter'){e.preventDefault();go();}});
  try{
    var ws=new WebSocket((location.protocol==='https:'?'wss:':'ws:')+'//'+location.host+'/ws');
    ws.onmessage=function(ev){
      try{var d=JSON.parse(ev.data);
        if(d.type==='userCount')document.getElementById('main-user-count').textContent=d.count;
      }catch(e){}
    };
  }catch(e){}
})();
</script>
</body>
</html>
)HTML";
  return page;
}

std::string error_page_html(const std::string &headline,
                            const std::string &detail) {
  std::string page =
      "<!DOCTYPE html>\n<html>\n<head><title>Error</title>\n<style>\n"
      "body{font-family:system-ui,sans-serif;background:#0f172a;color:#fff;"
      "display:flex;align-items:center;justify-content:center;min-height:100vh;"
      "margin:0}\n"
      ".error{text-align:center;background:rgba(255,255,255,.06);padding:32px;"
      "border-radius:16px}\n"
      "button{margin:8px;padding:10px 16px;border:none;border-radius:10px;"
      "background:#3b82f6;color:#fff;cursor:pointer}\n"
      "</style>\n</head>\n<body>\n<div class=\"error\">\n";
  page += "<h2>" + html_escape(headline) + "</h2>\n";
  if (!detail.empty()) page += "<p>" + html_escape(detail) + "</p>\n";
  page +=
      "<button onclick=\"history.back()\">&#8592; Back</button>\n"
      "<button onclick=\"window.location.reload()\">&#8635; Retry</button>\n"
      "<button onclick=\"window.location.href='/'\">Home</button>\n"
      "</div>\n</body>\n</html>\n";
  return page;
}
